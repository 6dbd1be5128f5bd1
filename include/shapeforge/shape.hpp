#pragma once

// shapeforge/shape.hpp: shape identities, kinds and the closed trait set.
//
// MEMORY OWNERSHIP:
//   Shape is a value type. The Model arena owns every shape, members included.
//   A member's `target` and a container's `member_ids` are lookup keys into the
//   arena, never owning links, so cyclic graphs need no special handling here.
//
// TRAITS:
//   Trait is a std::variant over every kind this library understands. Code that
//   must treat each kind (trait_id, the loader) uses std::visit, so adding an
//   alternative is a compile error until those sites handle it.

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "shapeforge/jsonlite.hpp"

namespace shapeforge {

struct ShapeId {
  std::string ns;
  std::string name;
  std::string member;  // empty for non-member shapes

  // Parses "ns#Name" or "ns#Name$member". Throws Error(invalid_shape_id).
  static ShapeId from(const std::string& text);

  ShapeId with_member(const std::string& member_name) const { return ShapeId{ns, name, member_name}; }
  ShapeId without_member() const { return ShapeId{ns, name, {}}; }
  bool has_member() const { return !member.empty(); }
  std::string to_string() const;

  auto operator<=>(const ShapeId&) const = default;
};

inline constexpr const char* kPreludeNamespace = "smithy.api";

enum class ShapeType {
  blob,
  boolean,
  string,
  byte,
  short_,
  integer,
  long_,
  float_,
  double_,
  timestamp,
  document,
  list,
  map,
  structure,
  union_,
  member,
  service,
  operation,
};

std::string to_string(ShapeType type);
// Returns nullopt for names this library does not model.
std::optional<ShapeType> parse_shape_type(const std::string& name);

enum class Protocol {
  aws_json_1_0,
  aws_json_1_1,
  rest_json_1,
  rest_xml,
  rpcv2_cbor,
};

// "aws.protocols#restJson1", "smithy.protocols#rpcv2Cbor", ...
std::string protocol_trait_id(Protocol protocol);
std::optional<Protocol> protocol_from_trait_id(const std::string& id);

struct LengthTrait {
  std::optional<std::int64_t> min;
  std::optional<std::int64_t> max;
};
struct RangeTrait {
  std::optional<double> min;
  std::optional<double> max;
};
struct PatternTrait {
  std::string regex;
};
struct UniqueItemsTrait {};
struct RequiredTrait {};
struct DefaultTrait {
  jsonlite::Value value;
};
struct ErrorTrait {
  std::string kind;  // "client" or "server"
};
struct ProtocolTrait {
  Protocol protocol;
};
struct StreamingTrait {};
struct EventHeaderTrait {};
struct EventPayloadTrait {};
struct EnumTrait {
  std::vector<std::string> values;
};
// Marks the synthetic input/output structures created by OperationNormalizer.
struct SyntheticInputOutputTrait {
  ShapeId operation;
  std::optional<ShapeId> original;
};
// Attached by EventStreamNormalizer to a streaming union whose error members
// were split out. The member shapes themselves leave the model.
struct EventStreamErrorMember {
  std::string name;
  ShapeId target;
};
struct SyntheticEventStreamUnionTrait {
  std::vector<EventStreamErrorMember> error_members;
};

using Trait = std::variant<LengthTrait, RangeTrait, PatternTrait, UniqueItemsTrait, RequiredTrait,
                           DefaultTrait, ErrorTrait, ProtocolTrait, StreamingTrait, EventHeaderTrait,
                           EventPayloadTrait, EnumTrait, SyntheticInputOutputTrait,
                           SyntheticEventStreamUnionTrait>;

// Absolute trait shape id, e.g. "smithy.api#length" or "aws.protocols#restJson1".
std::string trait_id(const Trait& trait);

struct Shape {
  ShapeId id;
  ShapeType type{ShapeType::structure};
  std::vector<Trait> traits;

  // structure/union: members in model order (sorted by name); list: [member];
  // map: [key, value].
  std::vector<ShapeId> member_ids;

  // member only
  std::optional<ShapeId> target;

  // service only
  std::string version;
  std::vector<ShapeId> operations;

  // operation only
  std::optional<ShapeId> input;
  std::optional<ShapeId> output;
  std::vector<ShapeId> errors;

  template <typename T>
  const T* find_trait() const {
    for (const auto& t : traits) {
      if (const T* p = std::get_if<T>(&t)) return p;
    }
    return nullptr;
  }

  template <typename T>
  bool has_trait() const {
    return find_trait<T>() != nullptr;
  }

  template <typename T>
  void remove_trait() {
    std::erase_if(traits, [](const Trait& t) { return std::holds_alternative<T>(t); });
  }

  bool is_member() const { return type == ShapeType::member; }
  const std::string& member_name() const { return id.member; }
};

// A default trait whose value is not null.
bool has_non_null_default(const Shape& shape);

}  // namespace shapeforge
