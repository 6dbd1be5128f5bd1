#pragma once

// shapeforge/jsonlite.hpp: small JSON value tree used for model documents,
// trait values and the codegen settings document.
//
// Objects are std::map, so serialization is canonical (sorted keys) and a
// loaded document iterates in key order. Non-negative integers are kept as
// uint64, every other number as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace shapeforge::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) || std::holds_alternative<double>(v);
  }

  bool operator==(const Value& other) const { return v == other.v; }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse a document whose root is an object. Returns an empty object and sets
// *error on failure (error may be null). Messages carry "line L, column C".
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);
std::string escape(const std::string& s);

// Recursive merge: keys present in both operands that hold objects on both
// sides are merged again; any other collision takes the value from `over`.
Object merge(const Object& base, const Object& over);

// Number as double regardless of its stored representation.
std::optional<double> as_double(const Value& v);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::optional<double> get_number(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

}  // namespace shapeforge::jsonlite
