#include "shapeforge/model_loader.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include "shapeforge/jsonlite.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

using jsonlite::Object;
using jsonlite::Value;

[[noreturn]] void invalid(const std::string& where, const std::string& what) {
  throw Error(ErrorCode::model_invalid, where + ": " + what);
}

std::optional<std::int64_t> get_i64(const Object& obj, const std::string& key) {
  auto n = jsonlite::get_number(obj, key);
  if (!n) return std::nullopt;
  return static_cast<std::int64_t>(*n);
}

// Converts one AST trait entry. Returns nullopt for traits this library does
// not model.
std::optional<Trait> convert_trait(const std::string& id, const Value& value, const std::string& where) {
  const Object empty;
  const Object& obj = value.is_object() ? std::get<Object>(value.v) : empty;

  if (id == "smithy.api#length") return LengthTrait{get_i64(obj, "min"), get_i64(obj, "max")};
  if (id == "smithy.api#range") {
    return RangeTrait{jsonlite::get_number(obj, "min"), jsonlite::get_number(obj, "max")};
  }
  if (id == "smithy.api#pattern") {
    if (!value.is_string()) invalid(where, "pattern trait must be a string");
    return PatternTrait{std::get<std::string>(value.v)};
  }
  if (id == "smithy.api#uniqueItems") return UniqueItemsTrait{};
  if (id == "smithy.api#required") return RequiredTrait{};
  if (id == "smithy.api#default") return DefaultTrait{value};
  if (id == "smithy.api#error") {
    if (!value.is_string()) invalid(where, "error trait must be a string");
    const auto& kind = std::get<std::string>(value.v);
    if (kind != "client" && kind != "server") invalid(where, "error trait must be client or server");
    return ErrorTrait{kind};
  }
  if (id == "smithy.api#streaming") return StreamingTrait{};
  if (id == "smithy.api#eventHeader") return EventHeaderTrait{};
  if (id == "smithy.api#eventPayload") return EventPayloadTrait{};
  if (id == "smithy.api#enum") {
    EnumTrait t;
    if (value.is_array()) {
      for (const auto& def : std::get<jsonlite::Array>(value.v)) {
        if (def.is_object()) t.values.push_back(jsonlite::get_string(std::get<Object>(def.v), "value"));
      }
    }
    return t;
  }
  if (auto protocol = protocol_from_trait_id(id)) return ProtocolTrait{*protocol};
  return std::nullopt;
}

std::vector<Trait> convert_traits(const Object& shape_obj, const std::string& where) {
  std::vector<Trait> out;
  const Object* traits = jsonlite::get_object(shape_obj, "traits");
  if (!traits) return out;
  for (const auto& [id, value] : *traits) {
    if (auto t = convert_trait(id, value, where)) {
      out.push_back(std::move(*t));
    } else {
      log_debug("loader", "dropping unsupported trait " + id + " on " + where);
    }
  }
  return out;
}

ShapeId target_of(const Object& ref, const std::string& where) {
  const std::string target = jsonlite::get_string(ref, "target");
  if (target.empty()) invalid(where, "missing target");
  return ShapeId::from(target);
}

std::vector<ShapeId> target_list(const Object& obj, const std::string& key, const std::string& where) {
  std::vector<ShapeId> out;
  const jsonlite::Array* refs = jsonlite::get_array(obj, key);
  if (!refs) return out;
  for (const auto& r : *refs) {
    if (!r.is_object()) invalid(where, key + " entries must be objects");
    out.push_back(target_of(std::get<Object>(r.v), where));
  }
  return out;
}

void add_member(std::map<ShapeId, Shape>& shapes, Shape& container, const std::string& member_name,
                const Value& ref) {
  const ShapeId member_id = container.id.with_member(member_name);
  if (!ref.is_object()) invalid(member_id.to_string(), "member must be an object");
  const Object& obj = std::get<Object>(ref.v);
  Shape member;
  member.id = member_id;
  member.type = ShapeType::member;
  member.target = target_of(obj, member_id.to_string());
  member.traits = convert_traits(obj, member_id.to_string());
  container.member_ids.push_back(member_id);
  shapes[member_id] = std::move(member);
}

void load_shape(std::map<ShapeId, Shape>& shapes, const ShapeId& id, const Object& obj) {
  const std::string where = id.to_string();
  const std::string type_name = jsonlite::get_string(obj, "type");

  Shape shape;
  shape.id = id;
  shape.traits = convert_traits(obj, where);

  if (type_name == "enum" || type_name == "intEnum") {
    shape.type = type_name == "enum" ? ShapeType::string : ShapeType::integer;
    EnumTrait values;
    if (const Object* members = jsonlite::get_object(obj, "members")) {
      for (const auto& [name, m] : *members) values.values.push_back(name);
    }
    shape.traits.push_back(std::move(values));
    shapes[id] = std::move(shape);
    return;
  }
  if (type_name == "set") {
    shape.type = ShapeType::list;
    shape.traits.push_back(UniqueItemsTrait{});
  } else {
    auto type = parse_shape_type(type_name);
    if (!type || *type == ShapeType::member) invalid(where, "unsupported shape type '" + type_name + "'");
    shape.type = *type;
  }

  switch (shape.type) {
    case ShapeType::structure:
    case ShapeType::union_:
      if (const Object* members = jsonlite::get_object(obj, "members")) {
        for (const auto& [name, ref] : *members) add_member(shapes, shape, name, ref);
      }
      break;
    case ShapeType::list: {
      auto it = obj.find("member");
      if (it == obj.end()) invalid(where, "list without member");
      add_member(shapes, shape, "member", it->second);
      break;
    }
    case ShapeType::map: {
      auto key = obj.find("key");
      auto value = obj.find("value");
      if (key == obj.end() || value == obj.end()) invalid(where, "map without key or value");
      add_member(shapes, shape, "key", key->second);
      add_member(shapes, shape, "value", value->second);
      break;
    }
    case ShapeType::service:
      shape.version = jsonlite::get_string(obj, "version");
      shape.operations = target_list(obj, "operations", where);
      break;
    case ShapeType::operation:
      if (const Object* in = jsonlite::get_object(obj, "input")) shape.input = target_of(*in, where);
      if (const Object* out = jsonlite::get_object(obj, "output")) shape.output = target_of(*out, where);
      shape.errors = target_list(obj, "errors", where);
      break;
    default:
      break;
  }
  shapes[id] = std::move(shape);
}

void validate_references(const std::map<ShapeId, Shape>& shapes) {
  const auto require = [&](const ShapeId& from, const ShapeId& to) {
    if (!shapes.contains(to)) invalid(from.to_string(), "unresolved reference to " + to.to_string());
  };
  for (const auto& [id, shape] : shapes) {
    if (shape.target) require(id, *shape.target);
    for (const auto& op : shape.operations) require(id, op);
    for (const auto& err : shape.errors) require(id, err);
    if (shape.input) require(id, *shape.input);
    if (shape.output) require(id, *shape.output);
  }
}

Shape prelude_shape(const std::string& name, ShapeType type) {
  Shape s;
  s.id = ShapeId{kPreludeNamespace, name, {}};
  s.type = type;
  return s;
}

}  // namespace

Model prelude_model() {
  std::map<ShapeId, Shape> shapes;
  const auto add = [&](Shape s) { shapes[s.id] = std::move(s); };
  const auto add_primitive = [&](const std::string& name, ShapeType type, Value def) {
    Shape s = prelude_shape(name, type);
    s.traits.push_back(DefaultTrait{std::move(def)});
    add(std::move(s));
  };

  add(prelude_shape("String", ShapeType::string));
  add(prelude_shape("Blob", ShapeType::blob));
  add(prelude_shape("Boolean", ShapeType::boolean));
  add(prelude_shape("Byte", ShapeType::byte));
  add(prelude_shape("Short", ShapeType::short_));
  add(prelude_shape("Integer", ShapeType::integer));
  add(prelude_shape("Long", ShapeType::long_));
  add(prelude_shape("Float", ShapeType::float_));
  add(prelude_shape("Double", ShapeType::double_));
  add(prelude_shape("Timestamp", ShapeType::timestamp));
  add(prelude_shape("Document", ShapeType::document));
  add(prelude_shape("Unit", ShapeType::structure));
  add_primitive("PrimitiveBoolean", ShapeType::boolean, Value{false});
  add_primitive("PrimitiveByte", ShapeType::byte, Value{std::uint64_t{0}});
  add_primitive("PrimitiveShort", ShapeType::short_, Value{std::uint64_t{0}});
  add_primitive("PrimitiveInteger", ShapeType::integer, Value{std::uint64_t{0}});
  add_primitive("PrimitiveLong", ShapeType::long_, Value{std::uint64_t{0}});
  add_primitive("PrimitiveFloat", ShapeType::float_, Value{0.0});
  add_primitive("PrimitiveDouble", ShapeType::double_, Value{0.0});
  return Model(std::move(shapes));
}

Model load_model_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(text, &err);
  if (err) {
    throw Error(err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key
                                                  : ErrorCode::json_parse_error,
                err->message);
  }
  const std::string version = jsonlite::get_string(root, "smithy");
  if (version.empty()) invalid("document", "missing smithy version");

  std::map<ShapeId, Shape> shapes = prelude_model().shapes();
  if (const Object* defs = jsonlite::get_object(root, "shapes")) {
    for (const auto& [id_text, def] : *defs) {
      const ShapeId id = ShapeId::from(id_text);
      if (id.has_member()) invalid(id_text, "top-level shape ids cannot name a member");
      if (!def.is_object()) invalid(id_text, "shape definition must be an object");
      load_shape(shapes, id, std::get<Object>(def.v));
    }
  }
  validate_references(shapes);
  log_debug("loader", "loaded model with " + std::to_string(shapes.size()) + " shapes");
  return Model(std::move(shapes));
}

Model load_model_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw Error(ErrorCode::io_error, "cannot read model file " + path);
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return load_model_json(text);
}

}  // namespace shapeforge
