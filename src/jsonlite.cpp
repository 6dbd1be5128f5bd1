#include "shapeforge/jsonlite.hpp"

// Serialization is canonical: objects come out in std::map order and doubles
// go through a fixed "%.6f" format, so equal trees always produce equal text.
// Generated settings documents and manifest digests depend on that.

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace shapeforge::jsonlite {

namespace {

constexpr int kMaxDepth = 512;

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value root = value(0);
    skip_ws();
    if (!error_ && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    return root;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  void fail(const char* code, const std::string& what) {
    if (error_) return;
    size_t line = 1, column = 1;
    for (size_t k = 0; k < pos_ && k < text_.size(); ++k) {
      if (text_[k] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    error_ = JsonError{code, what + " at line " + std::to_string(line) + ", column " + std::to_string(column)};
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(const char* word) {
    const std::string_view w(word);
    if (text_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    skip_ws();
    if (at_end()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    switch (peek()) {
      case '{': return Value{object(depth)};
      case '[': return Value{array(depth)};
      case '"': return Value{string()};
      default: break;
    }
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
    fail("json_parse_error", std::string("unexpected character '") + peek() + "'");
    return {};
  }

  Object object(int depth) {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    do {
      skip_ws();
      if (peek() != '"') {
        fail("json_parse_error", "expected a quoted key");
        return out;
      }
      std::string key = string();
      if (error_) return out;
      if (out.contains(key)) {
        fail("json_duplicate_key", "duplicate key '" + key + "'");
        return out;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':' after key '" + key + "'");
        return out;
      }
      Value v = value(depth + 1);
      if (error_) return out;
      out.emplace(std::move(key), std::move(v));
    } while (consume(','));
    if (!consume('}')) fail("json_parse_error", "expected ',' or '}'");
    return out;
  }

  Array array(int depth) {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    do {
      out.push_back(value(depth + 1));
      if (error_) return out;
    } while (consume(','));
    if (!consume(']')) fail("json_parse_error", "expected ',' or ']'");
    return out;
  }

  unsigned hex4() {
    unsigned cp = 0;
    for (int k = 0; k < 4; ++k, ++pos_) {
      const char h = peek();
      cp <<= 4;
      if (h >= '0' && h <= '9') {
        cp |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        cp |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        cp |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("json_parse_error", "invalid \\u escape");
        return 0;
      }
    }
    return cp;
  }

  static void put_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string string() {
    std::string out;
    ++pos_;  // opening quote
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char e = text_[pos_++];
      switch (e) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'u': {
          unsigned cp = hex4();
          if (error_) return out;
          // Surrogate pair.
          if (cp >= 0xD800 && cp <= 0xDBFF && literal("\\u")) {
            const unsigned low = hex4();
            if (error_) return out;
            if (low < 0xDC00 || low > 0xDFFF) {
              fail("json_parse_error", "invalid low surrogate in \\u escape");
              return out;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          put_utf8(out, cp);
          break;
        }
        default: out += e; break;
      }
    }
    fail("json_parse_error", "unterminated string");
    return out;
  }

  Value number() {
    const size_t start = pos_;
    const auto digits = [&] {
      const size_t from = pos_;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
      return pos_ > from;
    };
    const bool negative = peek() == '-';
    if (negative) ++pos_;
    if (!digits()) {
      fail("json_parse_error", "malformed number");
      return {};
    }
    bool integral = true;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!digits()) {
        fail("json_parse_error", "malformed fraction");
        return {};
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!digits()) {
        fail("json_parse_error", "malformed exponent");
        return {};
      }
    }

    const std::string token = text_.substr(start, pos_ - start);
    errno = 0;
    if (integral && !negative) {
      const unsigned long long u = std::strtoull(token.c_str(), nullptr, 10);
      if (errno == ERANGE) {
        fail("json_parse_error", "integer out of range: " + token);
        return {};
      }
      return Value{static_cast<std::uint64_t>(u)};
    }
    const double d = std::strtod(token.c_str(), nullptr);
    if (errno == ERANGE) {
      fail("json_parse_error", "number out of range: " + token);
      return {};
    }
    return Value{d};
  }

  const std::string& text_;
  size_t pos_{0};
  std::optional<JsonError> error_;
};

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<size_t>(n));
  while (out.back() == '0') out.pop_back();
  if (out.back() == '.') out += '0';
  return out;
}

void write(const Value& v, std::string& out);

void write(const Object& obj, std::string& out) {
  out += '{';
  bool first = true;
  for (const auto& [key, value] : obj) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += escape(key);
    out += "\":";
    write(value, out);
  }
  out += '}';
}

void write(const Value& v, std::string& out) {
  if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*u);
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    out += format_double(*d);
  } else if (const auto* s = std::get_if<std::string>(&v.v)) {
    out += '"';
    out += escape(*s);
    out += '"';
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    write(*o, out);
  } else if (const auto* a = std::get_if<Array>(&v.v)) {
    out += '[';
    for (size_t k = 0; k < a->size(); ++k) {
      if (k) out += ',';
      write((*a)[k], out);
    }
    out += ']';
  } else {
    out += "null";
  }
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value root = reader.document();
  std::optional<JsonError> err = reader.error();
  if (!err && !root.is_object()) err = JsonError{"json_parse_error", "document root is not an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(root.v));
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string to_json(const Value& v) {
  std::string out;
  write(v, out);
  return out;
}

std::string to_json(const Object& obj) {
  std::string out;
  write(obj, out);
  return out;
}

Object merge(const Object& base, const Object& over) {
  Object out = base;
  for (const auto& [key, value] : over) {
    auto [it, inserted] = out.try_emplace(key, value);
    if (inserted) continue;
    if (it->second.is_object() && value.is_object()) {
      it->second = Value{merge(std::get<Object>(it->second.v), std::get<Object>(value.v))};
    } else {
      it->second = value;
    }
  }
  return out;
}

std::optional<double> as_double(const Value& v) {
  if (const auto* d = std::get_if<double>(&v.v)) return *d;
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return static_cast<double>(*u);
  return std::nullopt;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = find_as<bool>(obj, key);
  return b ? *b : def;
}

std::optional<double> get_number(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  return as_double(it->second);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* items = find_as<Array>(obj, key)) {
    for (const auto& item : *items) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) { return find_as<Object>(obj, key); }

const Array* get_array(const Object& obj, const std::string& key) { return find_as<Array>(obj, key); }

}  // namespace shapeforge::jsonlite
