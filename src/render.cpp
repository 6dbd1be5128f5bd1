#include "shapeforge/render.hpp"

#include <map>

#include "shapeforge/log.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

// Access specifiers sit one column left of the class body.
void access(CodeWriter& w, const std::string& spec) {
  w.dedent();
  w.line(" " + spec + ":");
  w.indent();
}

bool is_aggregate(const Shape& shape) {
  return shape.type == ShapeType::structure || shape.type == ShapeType::union_;
}

std::string storage_name(const Symbol& sym) { return sym.member_name + "_"; }

std::string variant_stem(const Shape& member) {
  return escape_identifier(to_snake_case(member.member_name()));
}

// Scalar members are carried by the flat payload codec and by headers.
enum class Scalar { string, boolean, integer, floating, blob };

Scalar scalar_of(const Shape& target, const std::string& where) {
  switch (target.type) {
    case ShapeType::string: return Scalar::string;
    case ShapeType::boolean: return Scalar::boolean;
    case ShapeType::byte:
    case ShapeType::short_:
    case ShapeType::integer:
    case ShapeType::long_:
    case ShapeType::timestamp: return Scalar::integer;
    case ShapeType::float_:
    case ShapeType::double_: return Scalar::floating;
    case ShapeType::blob: return Scalar::blob;
    default: break;
  }
  throw Error(ErrorCode::unsupported_shape,
              where + ": " + to_string(target.type) + " cannot be carried in a flat event payload");
}

std::string flat_value(Scalar s, const std::string& expr) {
  switch (s) {
    case Scalar::string:
    case Scalar::boolean: return expr;
    case Scalar::integer: return "static_cast<std::int64_t>(" + expr + ")";
    case Scalar::floating: return "static_cast<double>(" + expr + ")";
    case Scalar::blob: return "runtime::blob_text(" + expr + ")";
  }
  return expr;
}

void encode_flat_member(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& member,
                        const std::string& owner) {
  const Symbol sym = resolver.to_symbol(member);
  const Scalar s = scalar_of(model.target_of(member), member.id.to_string());
  const std::string field = owner + "." + sym.member_name;
  const std::string put = "out.field(" + cpp_string_literal(member.member_name()) + ", ";
  if (sym.optional) {
    w.line("if (" + field + ") " + put + flat_value(s, "*" + field) + ");");
  } else {
    w.line(put + flat_value(s, field) + ");");
  }
}

void decode_flat_member(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& member) {
  const Symbol sym = resolver.to_symbol(member);
  const Scalar s = scalar_of(model.target_of(member), member.id.to_string());
  const std::string name = cpp_string_literal(member.member_name());
  const std::string set = "b." + sym.member_name;
  switch (s) {
    case Scalar::string:
      w.line("if (auto v = in.text(" + name + ")) " + set + "(*v);");
      break;
    case Scalar::boolean:
      w.line("if (auto v = in.boolean(" + name + ")) " + set + "(*v);");
      break;
    case Scalar::integer:
      w.line("if (auto v = in.integer(" + name + ")) " + set + "(static_cast<" + sym.qualified_name() + ">(*v));");
      break;
    case Scalar::floating:
      w.line("if (auto v = in.number(" + name + ")) " + set + "(static_cast<" + sym.qualified_name() + ">(*v));");
      break;
    case Scalar::blob:
      w.line("if (auto v = in.text(" + name + ")) " + set + "(runtime::blob_from(*v));");
      break;
  }
}

// HeaderValue alternative for a header member's target.
std::string header_alternative(const Shape& target, const std::string& where) {
  switch (target.type) {
    case ShapeType::string: return "std::string";
    case ShapeType::blob: return "runtime::Blob";
    case ShapeType::boolean: return "bool";
    case ShapeType::byte:
    case ShapeType::short_:
    case ShapeType::integer: return "std::int32_t";
    case ShapeType::long_:
    case ShapeType::timestamp: return "std::int64_t";
    default: break;
  }
  throw Error(ErrorCode::unsupported_shape, where + ": " + to_string(target.type) + " cannot be an event header");
}

void encode_header_member(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& member) {
  const Symbol sym = resolver.to_symbol(member);
  const std::string alt = header_alternative(model.target_of(member), member.id.to_string());
  const std::string field = "e." + sym.member_name;
  const std::string value = sym.optional ? "*" + field : field;
  const bool cast = alt == "std::int32_t" || alt == "std::int64_t";
  const std::string add = "message.add_header(" + cpp_string_literal(member.member_name()) + ", " +
                          (cast ? "static_cast<" + alt + ">(" + value + ")" : value) + ");";
  if (sym.optional) {
    w.line("if (" + field + ") " + add);
  } else {
    w.line(add);
  }
}

void decode_header_member(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& member) {
  const Symbol sym = resolver.to_symbol(member);
  const std::string alt = header_alternative(model.target_of(member), member.id.to_string());
  std::string value = "std::get<" + alt + ">(*h)";
  if (alt == "std::int32_t" || alt == "std::int64_t") value = "static_cast<" + sym.qualified_name() + ">(" + value + ")";
  w.line("if (const auto* h = message.header(" + cpp_string_literal(member.member_name()) + ")) b." +
         sym.member_name + "(" + value + ");");
}

const Shape* payload_member(const Model& model, const Shape& event) {
  for (const Shape* m : model.members(event)) {
    if (m->has_trait<EventPayloadTrait>()) return m;
  }
  return nullptr;
}

std::vector<const Shape*> body_members(const Model& model, const Shape& event) {
  std::vector<const Shape*> out;
  for (const Shape* m : model.members(event)) {
    if (!m->has_trait<EventHeaderTrait>() && !m->has_trait<EventPayloadTrait>()) out.push_back(m);
  }
  return out;
}

std::vector<const Shape*> header_members(const Model& model, const Shape& event) {
  std::vector<const Shape*> out;
  for (const Shape* m : model.members(event)) {
    if (m->has_trait<EventHeaderTrait>()) out.push_back(m);
  }
  return out;
}

// detail::encode_X / detail::decode_X for a flat structure or union.
void render_flat_helpers(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& shape) {
  const std::string q = resolver.to_symbol(shape).qualified_name();
  const std::string& name = shape.id.name;
  const bool client = render_unknown_variant(resolver.target());
  const auto members = model.members(shape);

  w.open_block("inline std::string encode_" + name + "([[maybe_unused]] const " + q + "& value)");
  w.line("runtime::FlatWriter out(kPayloadFormat, " + cpp_string_literal(name) + ");");
  if (shape.type == ShapeType::structure) {
    for (const Shape* m : members) encode_flat_member(w, model, resolver, *m, "value");
  } else {
    bool first = true;
    for (const Shape* m : members) {
      const Scalar s = scalar_of(model.target_of(*m), m->id.to_string());
      const std::string stem = variant_stem(*m);
      w.line(std::string(first ? "if" : "} else if") + " (value.is_" + stem + "()) {");
      w.indent();
      w.line("out.field(" + cpp_string_literal(m->member_name()) + ", " + flat_value(s, "value.as_" + stem + "()") +
             ");");
      w.dedent();
      first = false;
    }
    const std::string fail =
        "throw runtime::MarshallError(" + cpp_string_literal(name + ": variant cannot be encoded") + ");";
    if (first) {
      w.line(fail);
    } else {
      w.line("} else {");
      w.indent();
      w.line(fail);
      w.dedent();
      w.line("}");
    }
  }
  w.line("return out.finish();");
  w.close_block();
  w.blank();

  w.open_block("inline " + q + " decode_" + name + "([[maybe_unused]] const runtime::FlatReader& in)");
  if (shape.type == ShapeType::structure) {
    w.line("auto b = " + q + "::builder();");
    for (const Shape* m : members) decode_flat_member(w, model, resolver, *m);
    w.line("return b.build();");
  } else {
    for (const Shape* m : members) {
      const Symbol sym = resolver.to_symbol(*m);
      const Scalar s = scalar_of(model.target_of(*m), m->id.to_string());
      const std::string key = cpp_string_literal(m->member_name());
      const std::string make = q + "::" + variant_stem(*m);
      switch (s) {
        case Scalar::string: w.line("if (auto v = in.text(" + key + ")) return " + make + "(*v);"); break;
        case Scalar::boolean: w.line("if (auto v = in.boolean(" + key + ")) return " + make + "(*v);"); break;
        case Scalar::integer:
          w.line("if (auto v = in.integer(" + key + ")) return " + make + "(static_cast<" + sym.qualified_name() +
                 ">(*v));");
          break;
        case Scalar::floating:
          w.line("if (auto v = in.number(" + key + ")) return " + make + "(static_cast<" + sym.qualified_name() +
                 ">(*v));");
          break;
        case Scalar::blob:
          w.line("if (auto v = in.text(" + key + ")) return " + make + "(runtime::blob_from(*v));");
          break;
      }
    }
    if (client) {
      w.line("return " + q + "::unknown();");
    } else {
      w.line("throw runtime::UnmarshallError(" + cpp_string_literal(name + ": no known variant in payload") + ");");
    }
  }
  w.close_block();
  w.blank();
}

void render_marshall_branch(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                            const Shape& stream_member) {
  const Shape& event = model.target_of(stream_member);
  const std::string stem = variant_stem(stream_member);
  w.open_block("if (event.is_" + stem + "())");
  w.line("[[maybe_unused]] const auto& e = event.as_" + stem + "();");
  w.line("message.add_header(\":event-type\", std::string(" + cpp_string_literal(stream_member.member_name()) +
         "));");
  for (const Shape* h : header_members(model, event)) encode_header_member(w, model, resolver, *h);

  if (const Shape* p = payload_member(model, event)) {
    const Shape& target = model.target_of(*p);
    const Symbol sym = resolver.to_symbol(*p);
    const std::string field = "e." + sym.member_name;
    const std::string value = sym.optional ? "*" + field : field;
    std::string content_type;
    std::string payload;
    switch (target.type) {
      case ShapeType::blob:
        content_type = "std::string(\"application/octet-stream\")";
        payload = "runtime::blob_text(" + value + ")";
        break;
      case ShapeType::string:
        content_type = "std::string(\"text/plain\")";
        payload = value;
        break;
      case ShapeType::structure:
      case ShapeType::union_:
        content_type = "std::string(kPayloadContentType)";
        payload = "detail::encode_" + target.id.name + "(" + value + ")";
        break;
      default:
        throw Error(ErrorCode::unsupported_shape,
                    p->id.to_string() + ": " + to_string(target.type) + " cannot be an event payload");
    }
    w.line("message.add_header(\":content-type\", " + content_type + ");");
    if (sym.optional) {
      w.line("if (" + field + ") message.payload = " + payload + ";");
    } else {
      w.line("message.payload = " + payload + ";");
    }
  } else {
    const auto body = body_members(model, event);
    if (!body.empty()) {
      w.line("message.add_header(\":content-type\", std::string(kPayloadContentType));");
      w.line("runtime::FlatWriter out(kPayloadFormat, " + cpp_string_literal(event.id.name) + ");");
      for (const Shape* m : body) encode_flat_member(w, model, resolver, *m, "e");
      w.line("message.payload = out.finish();");
    }
  }
  w.line("return message;");
  w.close_block();
}

void render_unmarshall_branch(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                              const Shape& stream_member, const std::string& union_type) {
  const Shape& event = model.target_of(stream_member);
  const std::string q = resolver.to_symbol(event).qualified_name();
  w.open_block("if (event_type == " + cpp_string_literal(stream_member.member_name()) + ")");
  w.line("auto b = " + q + "::builder();");
  for (const Shape* h : header_members(model, event)) decode_header_member(w, model, resolver, *h);

  if (const Shape* p = payload_member(model, event)) {
    const Shape& target = model.target_of(*p);
    const std::string set = "b." + resolver.to_symbol(*p).member_name;
    switch (target.type) {
      case ShapeType::blob: w.line(set + "(runtime::blob_from(message.payload));"); break;
      case ShapeType::string: w.line(set + "(message.payload);"); break;
      case ShapeType::structure:
      case ShapeType::union_:
        w.line(set + "(detail::decode_" + target.id.name + "(runtime::FlatReader(kPayloadFormat, message.payload)));");
        break;
      default:
        throw Error(ErrorCode::unsupported_shape,
                    p->id.to_string() + ": " + to_string(target.type) + " cannot be an event payload");
    }
  } else {
    const auto body = body_members(model, event);
    if (!body.empty()) {
      w.line("const runtime::FlatReader in(kPayloadFormat, message.payload);");
      for (const Shape* m : body) decode_flat_member(w, model, resolver, *m);
    }
  }
  w.line("return " + union_type + "::" + variant_stem(stream_member) + "(b.build());");
  w.close_block();
}

}  // namespace

void render_structure(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& structure) {
  const std::string name = resolver.to_symbol(structure).name;
  w.open_block("struct " + name);
  for (const Shape* m : model.members(structure)) {
    const Shape& target = model.target_of(*m);
    const Symbol sym = resolver.to_symbol(*m);
    if (!is_aggregate(target) && !sym.module.empty()) {
      throw Error(ErrorCode::unsupported_shape, m->id.to_string() + ": constrained type " + sym.qualified_name() +
                                                    " has no generated wrapper");
    }
    w.line(sym.declared_type() + " " + sym.member_name + ";");
  }
  if (!structure.member_ids.empty()) w.blank();
  w.line("class Builder;");
  w.line("static Builder builder();");
  w.blank();
  w.line("bool operator==(const " + name + "&) const = default;");
  w.close_block(";");
}

void render_builder(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& structure,
                    bool fallible) {
  const std::string name = resolver.to_symbol(structure).name;
  const auto members = model.members(structure);

  w.open_block("class " + name + "::Builder");
  access(w, "public");
  for (const Shape* m : members) {
    const Symbol sym = resolver.to_symbol(*m);
    w.open_block("Builder& " + sym.member_name + "(" + sym.qualified_name() + " value)");
    w.line(storage_name(sym) + " = std::move(value);");
    w.line("return *this;");
    w.close_block();
  }
  if (!members.empty()) w.blank();

  if (fallible) w.line("// Throws runtime::BuildError when a required member is unset.");
  w.open_block(name + " build() const");
  if (fallible) {
    for (const Shape* m : members) {
      const Symbol sym = resolver.to_symbol(*m);
      if (sym.optional || has_non_null_default(*m)) continue;
      w.line("if (!" + storage_name(sym) + ") throw runtime::BuildError(" +
             cpp_string_literal(name + ": `" + m->member_name() + "` was not provided") + ");");
    }
  }
  w.line(name + " out;");
  for (const Shape* m : members) {
    const Symbol sym = resolver.to_symbol(*m);
    const std::string lhs = "out." + sym.member_name + " = ";
    if (sym.optional) {
      w.line(lhs + storage_name(sym) + ";");
    } else if (fallible && !has_non_null_default(*m)) {
      w.line(lhs + "*" + storage_name(sym) + ";");
    } else {
      w.line(lhs + storage_name(sym) + ".value_or(" + default_value_literal(*m, sym) + ");");
    }
  }
  w.line("return out;");
  w.close_block();

  if (!members.empty()) {
    w.blank();
    access(w, "private");
    for (const Shape* m : members) {
      const Symbol sym = resolver.to_symbol(*m);
      w.line("std::optional<" + sym.qualified_name() + "> " + storage_name(sym) + ";");
    }
  }
  w.close_block(";");
}

void render_builder_accessor(CodeWriter& w, const SymbolResolver& resolver, const Shape& structure) {
  const std::string name = resolver.to_symbol(structure).name;
  w.line("inline " + name + "::Builder " + name + "::builder() { return Builder(); }");
}

void render_variant_class(CodeWriter& w, const std::string& class_name, const std::vector<VariantCase>& given) {
  std::vector<VariantCase> cases = given;
  if (cases.empty()) cases.push_back(VariantCase{"unset", "std::monostate"});

  std::string alternatives;
  std::string kinds;
  for (const auto& c : cases) {
    if (!alternatives.empty()) alternatives += ", ";
    if (!kinds.empty()) kinds += ", ";
    alternatives += c.type;
    kinds += c.name;
  }

  w.open_block("class " + class_name);
  access(w, "public");
  w.line("enum class Kind { " + kinds + " };");
  w.blank();
  w.line(class_name + "() = default;");
  w.blank();
  for (size_t i = 0; i < cases.size(); ++i) {
    const VariantCase& c = cases[i];
    const std::string index = "std::in_place_index<" + std::to_string(i) + ">";
    if (c.type == "std::monostate") {
      w.line("static " + class_name + " " + c.name + "() { return " + class_name + "(" + index +
             ", std::monostate{}); }");
    } else {
      w.open_block("static " + class_name + " " + c.name + "(" + c.type + " value)");
      w.line("return " + class_name + "(" + index + ", std::move(value));");
      w.close_block();
    }
  }
  w.blank();
  w.line("Kind kind() const { return static_cast<Kind>(value_.index()); }");
  for (size_t i = 0; i < cases.size(); ++i) {
    const VariantCase& c = cases[i];
    w.line("bool is_" + c.name + "() const { return value_.index() == " + std::to_string(i) + "; }");
    if (c.type != "std::monostate") {
      w.line("const " + c.type + "& as_" + c.name + "() const { return std::get<" + std::to_string(i) +
             ">(value_); }");
    }
  }
  w.blank();
  w.line("bool operator==(const " + class_name + "&) const = default;");
  w.blank();
  access(w, "private");
  w.line("template <std::size_t I, typename V>");
  w.line(class_name + "(std::in_place_index_t<I>, V&& value) : value_(std::in_place_index<I>, std::forward<V>(value)) {}");
  w.blank();
  w.line("std::variant<" + alternatives + "> value_;");
  w.close_block(";");
}

void render_union(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& union_shape,
                  bool render_unknown) {
  std::vector<VariantCase> cases;
  for (const Shape* m : model.members(union_shape)) {
    cases.push_back(VariantCase{variant_stem(*m), resolver.to_symbol(*m).qualified_name()});
  }
  if (render_unknown) cases.push_back(VariantCase{"unknown", "std::monostate"});
  render_variant_class(w, resolver.to_symbol(union_shape).name, cases);
}

std::string default_value_literal(const Shape& member, const Symbol& sym) {
  const std::string type = sym.qualified_name();
  const DefaultTrait* d = member.find_trait<DefaultTrait>();
  if (d == nullptr) return type + "{}";
  if (const auto* b = std::get_if<bool>(&d->value.v)) return *b ? "true" : "false";
  if (const auto* u = std::get_if<std::uint64_t>(&d->value.v)) {
    return "static_cast<" + type + ">(" + std::to_string(*u) + ")";
  }
  if (const auto* n = std::get_if<double>(&d->value.v)) {
    return "static_cast<" + type + ">(" + std::to_string(*n) + ")";
  }
  if (const auto* s = std::get_if<std::string>(&d->value.v)) return type + "(" + cpp_string_literal(*s) + ")";
  return type + "{}";
}

std::string event_stream_runtime_source() {
  return R"rt(struct BuildError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct MarshallError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct UnmarshallError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

using Blob = std::vector<std::uint8_t>;

inline Blob blob_from(const std::string& text) { return Blob(text.begin(), text.end()); }
inline std::string blob_text(const Blob& blob) { return std::string(blob.begin(), blob.end()); }

using HeaderValue = std::variant<bool, std::int32_t, std::int64_t, std::string, Blob>;

struct Header {
  std::string name;
  HeaderValue value;

  bool operator==(const Header&) const = default;
};

// One event-stream message: ordered headers and a text payload.
struct Message {
  std::vector<Header> headers;
  std::string payload;

  Message& add_header(std::string name, HeaderValue value) {
    headers.push_back(Header{std::move(name), std::move(value)});
    return *this;
  }

  const HeaderValue* header(const std::string& name) const {
    for (const auto& h : headers) {
      if (h.name == name) return &h.value;
    }
    return nullptr;
  }

  // Empty when absent or not a string.
  std::string string_header(const std::string& name) const {
    const HeaderValue* value = header(name);
    if (value == nullptr || !std::holds_alternative<std::string>(*value)) return {};
    return std::get<std::string>(*value);
  }

  bool header_equals(const std::string& name, const HeaderValue& expected) const {
    const HeaderValue* value = header(name);
    return value != nullptr && *value == expected;
  }
};

enum class PayloadFormat { json, xml };

inline std::string escape_text(PayloadFormat format, const std::string& text) {
  std::string out;
  for (char c : text) {
    if (format == PayloadFormat::json) {
      switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c;
      }
    } else {
      switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        default: out += c;
      }
    }
  }
  return out;
}

inline std::string unescape_xml(const std::string& text) {
  std::string out;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '&') {
      out += text[i];
      continue;
    }
    const std::size_t end = text.find(';', i);
    if (end == std::string::npos) throw UnmarshallError("unterminated XML entity");
    const std::string entity = text.substr(i + 1, end - i - 1);
    if (entity == "amp") {
      out += '&';
    } else if (entity == "lt") {
      out += '<';
    } else if (entity == "gt") {
      out += '>';
    } else if (entity == "quot") {
      out += '"';
    } else if (entity == "apos") {
      out += '\'';
    } else {
      throw UnmarshallError("unknown XML entity &" + entity + ";");
    }
    i = end;
  }
  return out;
}

// Single-level object payload: {"a":1,"b":"x"} or <Root><a>1</a><b>x</b></Root>.
class FlatWriter {
 public:
  FlatWriter(PayloadFormat format, std::string root) : format_(format), root_(std::move(root)) {}

  void field(const std::string& name, const std::string& value) {
    if (format_ == PayloadFormat::json) {
      append(name, "\"" + escape_text(format_, value) + "\"");
    } else {
      append(name, escape_text(format_, value));
    }
  }
  void field(const std::string& name, const char* value) { field(name, std::string(value)); }
  void field(const std::string& name, std::int64_t value) { append(name, std::to_string(value)); }
  void field(const std::string& name, double value) { append(name, std::to_string(value)); }
  void field(const std::string& name, bool value) { append(name, value ? "true" : "false"); }

  std::string finish() const {
    if (format_ == PayloadFormat::json) return "{" + body_ + "}";
    return "<" + root_ + ">" + body_ + "</" + root_ + ">";
  }

 private:
  void append(const std::string& name, const std::string& encoded) {
    if (format_ == PayloadFormat::json) {
      if (!body_.empty()) body_ += ",";
      body_ += "\"" + escape_text(format_, name) + "\":" + encoded;
    } else {
      body_ += "<" + name + ">" + encoded + "</" + name + ">";
    }
  }

  PayloadFormat format_;
  std::string root_;
  std::string body_;
};

class FlatReader {
 public:
  FlatReader(PayloadFormat format, const std::string& text) {
    if (format == PayloadFormat::json) {
      parse_json(text);
    } else {
      parse_xml(text);
    }
  }

  // XML root element name; empty for JSON.
  const std::string& root() const { return root_; }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& field : fields_) out.push_back(field.first);
    return out;
  }

  std::optional<std::string> text(const std::string& name) const {
    for (const auto& field : fields_) {
      if (field.first == name) return field.second;
    }
    return std::nullopt;
  }

  std::optional<std::int64_t> integer(const std::string& name) const {
    const auto raw = text(name);
    if (!raw) return std::nullopt;
    std::size_t used = 0;
    const long long value = std::stoll(*raw, &used);
    if (used != raw->size()) throw UnmarshallError("`" + name + "` is not an integer");
    return static_cast<std::int64_t>(value);
  }

  std::optional<double> number(const std::string& name) const {
    const auto raw = text(name);
    if (!raw) return std::nullopt;
    return std::stod(*raw);
  }

  std::optional<bool> boolean(const std::string& name) const {
    const auto raw = text(name);
    if (!raw) return std::nullopt;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    throw UnmarshallError("`" + name + "` is not a boolean");
  }

 private:
  void parse_json(const std::string& s) {
    std::size_t i = 0;
    const auto skip = [&] {
      while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    };
    const auto expect = [&](char c) {
      skip();
      if (i >= s.size() || s[i] != c) throw UnmarshallError(std::string("expected '") + c + "' in JSON payload");
      ++i;
    };
    const auto read_string = [&] {
      expect('"');
      std::string out;
      while (i < s.size() && s[i] != '"') {
        char c = s[i++];
        if (c == '\\' && i < s.size()) {
          const char e = s[i++];
          c = e == 'n' ? '\n' : e == 't' ? '\t' : e == 'r' ? '\r' : e;
        }
        out += c;
      }
      if (i >= s.size()) throw UnmarshallError("unterminated string in JSON payload");
      ++i;
      return out;
    };

    expect('{');
    skip();
    if (i < s.size() && s[i] == '}') return;
    while (true) {
      std::string key = read_string();
      expect(':');
      skip();
      std::string value;
      if (i < s.size() && s[i] == '"') {
        value = read_string();
      } else {
        const std::size_t start = i;
        while (i < s.size() && s[i] != ',' && s[i] != '}' && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        value = s.substr(start, i - start);
        if (value.empty()) throw UnmarshallError("missing value for `" + key + "` in JSON payload");
      }
      fields_.emplace_back(std::move(key), std::move(value));
      skip();
      if (i < s.size() && s[i] == ',') {
        ++i;
        continue;
      }
      expect('}');
      return;
    }
  }

  void parse_xml(const std::string& s) {
    std::size_t i = 0;
    const auto read_tag = [&] {
      while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
      if (i >= s.size() || s[i] != '<') throw UnmarshallError("expected an element in XML payload");
      const std::size_t close = s.find('>', i);
      if (close == std::string::npos) throw UnmarshallError("unterminated tag in XML payload");
      std::string name = s.substr(i + 1, close - i - 1);
      i = close + 1;
      return name;
    };

    root_ = read_tag();
    while (true) {
      while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
      if (s.compare(i, 2, "</") == 0) {
        if (read_tag() != "/" + root_) throw UnmarshallError("mismatched closing tag in XML payload");
        return;
      }
      std::string name = read_tag();
      const std::string end = "</" + name + ">";
      const std::size_t stop = s.find(end, i);
      if (stop == std::string::npos) throw UnmarshallError("unterminated element <" + name + ">");
      fields_.emplace_back(name, unescape_xml(s.substr(i, stop - i)));
      i = stop + end.size();
    }
  }

  std::string root_;
  std::vector<std::pair<std::string, std::string>> fields_;
};
)rt";
}

GeneratedCodec render_event_stream_codec(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                                         const Shape& stream_union, PayloadFormat format,
                                         const std::string& content_type) {
  const bool client = render_unknown_variant(resolver.target());
  const std::string union_name = resolver.to_symbol(stream_union).name;
  const std::string union_type = resolver.to_symbol(stream_union).qualified_name();
  GeneratedCodec codec{union_name + "Marshaller", union_name + "Unmarshaller", "errors::" + union_name + "Error"};

  std::vector<EventStreamErrorMember> error_members;
  if (const auto* trait = stream_union.find_trait<SyntheticEventStreamUnionTrait>()) {
    error_members = trait->error_members;
  }

  // Flat payload targets and modeled errors get encode/decode helpers.
  std::map<ShapeId, const Shape*> flat;
  for (const Shape* m : model.members(stream_union)) {
    const Shape& event = model.target_of(*m);
    if (const Shape* p = payload_member(model, event)) {
      const Shape& target = model.target_of(*p);
      if (is_aggregate(target)) flat.emplace(target.id, &target);
    }
  }
  for (const auto& err : error_members) flat.emplace(err.target, &model.expect_shape(err.target));

  w.line(std::string("inline constexpr runtime::PayloadFormat kPayloadFormat = runtime::PayloadFormat::") +
         (format == PayloadFormat::json ? "json" : "xml") + ";");
  w.line("inline constexpr const char* kPayloadContentType = " + cpp_string_literal(content_type) + ";");
  w.blank();

  w.line("namespace detail {").blank();
  for (const auto& [id, shape] : flat) render_flat_helpers(w, model, resolver, *shape);
  w.line("}  // namespace detail").blank();

  w.open_block("class " + codec.marshaller);
  access(w, "public");
  w.open_block("runtime::Message marshall(const " + union_type + "& event) const");
  w.line("runtime::Message message;");
  w.line("message.add_header(\":message-type\", std::string(\"event\"));");
  for (const Shape* m : model.members(stream_union)) render_marshall_branch(w, model, resolver, *m);
  w.line("throw runtime::MarshallError(" + cpp_string_literal(union_name + ": event cannot be marshalled") + ");");
  w.close_block();
  w.close_block(";");
  w.blank();

  w.open_block("class " + codec.unmarshaller);
  access(w, "public");
  w.line("using Result = std::variant<" + union_type + ", " + codec.error_type + ">;");
  w.blank();
  w.open_block("Result unmarshall(const runtime::Message& message) const");
  w.line("const std::string message_type = message.string_header(\":message-type\");");
  w.open_block("if (message_type == \"event\")");
  w.line("const std::string event_type = message.string_header(\":event-type\");");
  for (const Shape* m : model.members(stream_union)) render_unmarshall_branch(w, model, resolver, *m, union_type);
  if (client) {
    w.line("return " + union_type + "::unknown();");
  } else {
    w.line("throw runtime::UnmarshallError(" + cpp_string_literal(union_name + ": unknown event type ") +
           " + event_type);");
  }
  w.close_block();

  w.open_block("if (message_type == \"exception\")");
  w.line("const std::string exception_type = message.string_header(\":exception-type\");");
  for (const auto& err : error_members) {
    const std::string stem = escape_identifier(to_snake_case(err.target.name));
    w.open_block("if (exception_type == " + cpp_string_literal(err.name) + ")");
    w.line("return " + codec.error_type + "::" + stem + "(detail::decode_" + err.target.name +
           "(runtime::FlatReader(kPayloadFormat, message.payload)));");
    w.close_block();
  }
  if (client) {
    w.line("return " + codec.error_type + "::unhandled(message.payload);");
  } else {
    w.line("throw runtime::UnmarshallError(" + cpp_string_literal(union_name + ": unmodeled exception ") +
           " + exception_type);");
  }
  w.close_block();

  if (client) {
    w.open_block("if (message_type == \"error\")");
    w.line("return " + codec.error_type + "::unhandled(message.string_header(\":error-message\"));");
    w.close_block();
  }
  w.line("throw runtime::UnmarshallError(\"unrecognized :message-type \" + message_type);");
  w.close_block();
  w.close_block(";");

  log_debug("render", "event stream codec for " + stream_union.id.to_string() + " (" + to_string(resolver.target()) +
                          ", " + std::to_string(error_members.size()) + " modeled errors)");
  return codec;
}

}  // namespace shapeforge
