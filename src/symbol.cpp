#include "shapeforge/symbol.hpp"

#include <cctype>
#include <utility>

#include "shapeforge/constraints.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

bool is_cpp_keyword(const std::string& s) {
  static const std::set<std::string> kws = {
      "alignas", "alignof", "and", "asm", "auto", "bool", "break", "case", "catch", "char",
      "class", "const", "constexpr", "continue", "default", "delete", "do", "double", "else",
      "enum", "explicit", "export", "extern", "false", "float", "for", "friend", "goto", "if",
      "inline", "int", "long", "mutable", "namespace", "new", "noexcept", "not", "nullptr",
      "operator", "or", "private", "protected", "public", "register", "return", "short",
      "signed", "sizeof", "static", "struct", "switch", "template", "this", "throw", "true",
      "try", "typedef", "typename", "union", "unsigned", "using", "virtual", "void",
      "volatile", "while", "xor"};
  return kws.contains(s);
}

}  // namespace

std::string to_string(CodegenTarget target) {
  return target == CodegenTarget::client ? "client" : "server";
}

std::string to_string(ConstraintKind kind) {
  switch (kind) {
    case ConstraintKind::length: return "length";
    case ConstraintKind::range: return "range";
    case ConstraintKind::pattern: return "pattern";
    case ConstraintKind::unique_items: return "uniqueItems";
    case ConstraintKind::enum_values: return "enum";
  }
  return "";
}

ConstraintPolicy ConstraintPolicy::defaults() {
  ConstraintPolicy p;
  p.allow(ShapeType::string, ConstraintKind::length)
      .allow(ShapeType::string, ConstraintKind::pattern)
      .allow(ShapeType::string, ConstraintKind::enum_values)
      .allow(ShapeType::list, ConstraintKind::length)
      .allow(ShapeType::list, ConstraintKind::unique_items)
      .allow(ShapeType::map, ConstraintKind::length)
      .allow(ShapeType::blob, ConstraintKind::length);
  for (ShapeType t : {ShapeType::byte, ShapeType::short_, ShapeType::integer, ShapeType::long_}) {
    p.allow(t, ConstraintKind::range);
  }
  return p;
}

ConstraintPolicy& ConstraintPolicy::allow(ShapeType type, ConstraintKind kind) {
  table_[type].insert(kind);
  return *this;
}

ConstraintPolicy& ConstraintPolicy::deny(ShapeType type, ConstraintKind kind) {
  auto it = table_.find(type);
  if (it != table_.end()) it->second.erase(kind);
  return *this;
}

bool ConstraintPolicy::materializes(ShapeType type, ConstraintKind kind) const {
  auto it = table_.find(type);
  return it != table_.end() && it->second.contains(kind);
}

std::string Symbol::qualified_name() const {
  return module.empty() ? name : module + "::" + name;
}

std::string Symbol::declared_type() const {
  return optional ? "std::optional<" + qualified_name() + ">" : qualified_name();
}

CppSymbolResolver::CppSymbolResolver(std::shared_ptr<const Model> model, SymbolResolverConfig config)
    : model_(std::move(model)), config_(std::move(config)) {
  if (!model_) throw Error(ErrorCode::model_invalid, "symbol resolver needs a model");
}

bool CppSymbolResolver::member_optional(const Shape& member) const {
  if (has_non_null_default(member)) return false;
  // Clients keep required members optional so a server omitting one is not fatal.
  if (config_.target == CodegenTarget::client) return true;
  return !member.has_trait<RequiredTrait>();
}

Symbol CppSymbolResolver::to_symbol(const Shape& shape) const {
  Symbol sym;
  switch (shape.type) {
    case ShapeType::member: {
      const Shape& target = model_->target_of(shape);
      sym = to_symbol(target);
      sym.member_name = escape_identifier(to_snake_case(shape.member_name()));
      sym.optional = member_optional(shape);
      return sym;
    }
    case ShapeType::blob: sym.name = "std::vector<std::uint8_t>"; break;
    case ShapeType::boolean: sym.name = "bool"; break;
    case ShapeType::byte: sym.name = "std::int8_t"; break;
    case ShapeType::short_: sym.name = "std::int16_t"; break;
    case ShapeType::integer: sym.name = "std::int32_t"; break;
    case ShapeType::long_: sym.name = "std::int64_t"; break;
    case ShapeType::float_: sym.name = "float"; break;
    case ShapeType::double_: sym.name = "double"; break;
    case ShapeType::timestamp: sym.name = "std::int64_t"; break;
    case ShapeType::document: sym.name = "std::string"; break;
    case ShapeType::string: sym.name = "std::string"; break;
    case ShapeType::list: {
      if (shape.member_ids.size() != 1) throw Error(ErrorCode::model_invalid, shape.id.to_string() + " has no member");
      const Shape& member = model_->expect_shape(shape.member_ids.at(0));
      sym.name = "std::vector<" + to_symbol(model_->target_of(member)).qualified_name() + ">";
      break;
    }
    case ShapeType::map: {
      if (shape.member_ids.size() != 2) throw Error(ErrorCode::model_invalid, shape.id.to_string() + " lacks a key or value");
      const Shape& value = model_->expect_shape(shape.member_ids.at(1));
      sym.name = "std::map<std::string, " + to_symbol(model_->target_of(value)).qualified_name() + ">";
      break;
    }
    case ShapeType::structure:
    case ShapeType::union_:
      sym.name = shape.id.name;
      sym.module = shape.has_trait<ErrorTrait>() ? "errors" : "models";
      if (shape.has_trait<SyntheticInputOutputTrait>()) sym.module = "output";
      return sym;
    case ShapeType::operation:
    case ShapeType::service:
      sym.name = shape.id.name;
      sym.module = "operation";
      return sym;
  }

  // Constrained simple shapes and collections get a named wrapper type on the
  // server, public or crate-private depending on settings.
  if (config_.target == CodegenTarget::server && shape.id.ns != kPreludeNamespace &&
      has_materialized_constraint(shape, config_.policy)) {
    if (config_.public_constrained_types) {
      sym.name = shape.id.name;
      sym.module = "models";
    } else {
      sym.name = shape.id.name + "Constrained";
      sym.module = "constrained";
    }
  }
  return sym;
}

std::shared_ptr<SymbolResolver> server_test_symbol_resolver(const Model& model,
                                                            bool public_constrained_types) {
  SymbolResolverConfig cfg;
  cfg.target = CodegenTarget::server;
  cfg.public_constrained_types = public_constrained_types;
  return std::make_shared<CppSymbolResolver>(std::make_shared<const Model>(model), std::move(cfg));
}

std::shared_ptr<SymbolResolver> client_test_symbol_resolver(const Model& model) {
  SymbolResolverConfig cfg;
  cfg.target = CodegenTarget::client;
  return std::make_shared<CppSymbolResolver>(std::make_shared<const Model>(model), std::move(cfg));
}

std::string to_snake_case(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 4);
  for (size_t i = 0; i < name.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(name[i]);
    if (std::isupper(c)) {
      const bool prev_lower = i > 0 && (std::islower(static_cast<unsigned char>(name[i - 1])) ||
                                        std::isdigit(static_cast<unsigned char>(name[i - 1])));
      const bool next_lower = i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1]));
      const bool prev_upper = i > 0 && std::isupper(static_cast<unsigned char>(name[i - 1]));
      if (i > 0 && (prev_lower || (prev_upper && next_lower)) && out.back() != '_') out += '_';
      out += static_cast<char>(std::tolower(c));
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

std::string escape_identifier(const std::string& name) {
  return is_cpp_keyword(name) ? name + "_" : name;
}

}  // namespace shapeforge
