#include "shapeforge/shape.hpp"

#include <array>
#include <utility>

#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::array<std::pair<ShapeType, const char*>, 18> kShapeTypeNames{{
    {ShapeType::blob, "blob"},
    {ShapeType::boolean, "boolean"},
    {ShapeType::string, "string"},
    {ShapeType::byte, "byte"},
    {ShapeType::short_, "short"},
    {ShapeType::integer, "integer"},
    {ShapeType::long_, "long"},
    {ShapeType::float_, "float"},
    {ShapeType::double_, "double"},
    {ShapeType::timestamp, "timestamp"},
    {ShapeType::document, "document"},
    {ShapeType::list, "list"},
    {ShapeType::map, "map"},
    {ShapeType::structure, "structure"},
    {ShapeType::union_, "union"},
    {ShapeType::member, "member"},
    {ShapeType::service, "service"},
    {ShapeType::operation, "operation"},
}};

constexpr std::array<std::pair<Protocol, const char*>, 5> kProtocolTraitIds{{
    {Protocol::aws_json_1_0, "aws.protocols#awsJson1_0"},
    {Protocol::aws_json_1_1, "aws.protocols#awsJson1_1"},
    {Protocol::rest_json_1, "aws.protocols#restJson1"},
    {Protocol::rest_xml, "aws.protocols#restXml"},
    {Protocol::rpcv2_cbor, "smithy.protocols#rpcv2Cbor"},
}};

bool valid_identifier(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

}  // namespace

ShapeId ShapeId::from(const std::string& text) {
  const auto hash = text.find('#');
  if (hash == std::string::npos || hash == 0) {
    throw Error(ErrorCode::invalid_shape_id, "missing namespace in '" + text + "'");
  }
  ShapeId id;
  id.ns = text.substr(0, hash);
  const std::string rest = text.substr(hash + 1);
  const auto dollar = rest.find('$');
  if (dollar == std::string::npos) {
    id.name = rest;
  } else {
    id.name = rest.substr(0, dollar);
    id.member = rest.substr(dollar + 1);
    if (id.member.empty()) {
      throw Error(ErrorCode::invalid_shape_id, "empty member name in '" + text + "'");
    }
  }
  if (!valid_identifier(id.ns) || !valid_identifier(id.name) ||
      (!id.member.empty() && !valid_identifier(id.member))) {
    throw Error(ErrorCode::invalid_shape_id, "malformed shape id '" + text + "'");
  }
  return id;
}

std::string ShapeId::to_string() const {
  std::string out = ns + "#" + name;
  if (!member.empty()) out += "$" + member;
  return out;
}

std::string to_string(ShapeType type) {
  for (const auto& [t, name] : kShapeTypeNames) {
    if (t == type) return name;
  }
  return "unknown";
}

std::optional<ShapeType> parse_shape_type(const std::string& name) {
  for (const auto& [t, n] : kShapeTypeNames) {
    if (name == n) return t;
  }
  return std::nullopt;
}

std::string protocol_trait_id(Protocol protocol) {
  for (const auto& [p, id] : kProtocolTraitIds) {
    if (p == protocol) return id;
  }
  return {};
}

std::optional<Protocol> protocol_from_trait_id(const std::string& id) {
  for (const auto& [p, name] : kProtocolTraitIds) {
    if (id == name) return p;
  }
  return std::nullopt;
}

std::string trait_id(const Trait& trait) {
  return std::visit(
      overloaded{
          [](const LengthTrait&) -> std::string { return "smithy.api#length"; },
          [](const RangeTrait&) -> std::string { return "smithy.api#range"; },
          [](const PatternTrait&) -> std::string { return "smithy.api#pattern"; },
          [](const UniqueItemsTrait&) -> std::string { return "smithy.api#uniqueItems"; },
          [](const RequiredTrait&) -> std::string { return "smithy.api#required"; },
          [](const DefaultTrait&) -> std::string { return "smithy.api#default"; },
          [](const ErrorTrait&) -> std::string { return "smithy.api#error"; },
          [](const ProtocolTrait& p) -> std::string { return protocol_trait_id(p.protocol); },
          [](const StreamingTrait&) -> std::string { return "smithy.api#streaming"; },
          [](const EventHeaderTrait&) -> std::string { return "smithy.api#eventHeader"; },
          [](const EventPayloadTrait&) -> std::string { return "smithy.api#eventPayload"; },
          [](const EnumTrait&) -> std::string { return "smithy.api#enum"; },
          [](const SyntheticInputOutputTrait&) -> std::string {
            return "smithy.synthetic#inputOutput";
          },
          [](const SyntheticEventStreamUnionTrait&) -> std::string {
            return "smithy.synthetic#eventStreamUnion";
          },
      },
      trait);
}

bool has_non_null_default(const Shape& shape) {
  const auto* d = shape.find_trait<DefaultTrait>();
  return d != nullptr && !d->value.is_null();
}

}  // namespace shapeforge
