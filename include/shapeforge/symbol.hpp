#pragma once

// shapeforge/symbol.hpp: shape -> generated C++ symbol mapping.
//
// The resolver answers two questions that depend on the codegen target:
//   - which type a shape is rendered as, and whether a member is optional;
//   - which constraint traits are materialized as validated types
//     (ConstraintPolicy).
// The constraint classifier asks the resolver instead of hardcoding either.

#include <map>
#include <memory>
#include <set>
#include <string>

#include "shapeforge/model.hpp"

namespace shapeforge {

enum class CodegenTarget { client, server };

std::string to_string(CodegenTarget target);

// Clients tolerate event variants they were not generated with.
inline bool render_unknown_variant(CodegenTarget target) { return target == CodegenTarget::client; }

enum class ConstraintKind { length, range, pattern, unique_items, enum_values };

std::string to_string(ConstraintKind kind);

// Which constraint trait kinds become a validated type for each shape kind.
// Anything absent from the table is recognized by the model but not enforced.
class ConstraintPolicy {
 public:
  // string: length, pattern, enum; list: length, uniqueItems; map: length;
  // byte/short/integer/long: range; blob: length.
  static ConstraintPolicy defaults();

  ConstraintPolicy& allow(ShapeType type, ConstraintKind kind);
  ConstraintPolicy& deny(ShapeType type, ConstraintKind kind);
  bool materializes(ShapeType type, ConstraintKind kind) const;

 private:
  std::map<ShapeType, std::set<ConstraintKind>> table_;
};

struct Symbol {
  std::string name;         // C++ spelling: "std::string", "TestStruct", "std::vector<MyString>"
  std::string module;       // "models", "errors", "output", "constrained"; empty for builtins
  std::string member_name;  // members only: escaped snake_case field name
  bool optional{false};

  // "models::TestStruct"; builtins stay unqualified.
  std::string qualified_name() const;
  // qualified_name() wrapped in std::optional when optional.
  std::string declared_type() const;
};

class SymbolResolver {
 public:
  virtual ~SymbolResolver() = default;

  virtual Symbol to_symbol(const Shape& shape) const = 0;
  virtual const ConstraintPolicy& constraint_policy() const = 0;
  virtual CodegenTarget target() const = 0;
  virtual const Model& model() const = 0;
};

struct SymbolResolverConfig {
  CodegenTarget target{CodegenTarget::server};
  bool public_constrained_types{true};
  ConstraintPolicy policy{ConstraintPolicy::defaults()};
};

class CppSymbolResolver : public SymbolResolver {
 public:
  CppSymbolResolver(std::shared_ptr<const Model> model, SymbolResolverConfig config);

  Symbol to_symbol(const Shape& shape) const override;
  const ConstraintPolicy& constraint_policy() const override { return config_.policy; }
  CodegenTarget target() const override { return config_.target; }
  const Model& model() const override { return *model_; }

 private:
  bool member_optional(const Shape& member) const;

  std::shared_ptr<const Model> model_;
  SymbolResolverConfig config_;
};

std::shared_ptr<SymbolResolver> server_test_symbol_resolver(const Model& model,
                                                            bool public_constrained_types = true);
std::shared_ptr<SymbolResolver> client_test_symbol_resolver(const Model& model);

// "someString" -> "some_string", "MapAPrecedence" -> "map_a_precedence".
std::string to_snake_case(const std::string& name);
// Appends '_' to C++ keywords.
std::string escape_identifier(const std::string& name);

}  // namespace shapeforge
