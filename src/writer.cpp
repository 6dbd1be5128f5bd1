#include "shapeforge/writer.hpp"

#include <cstdio>

#include "shapeforge/types.hpp"

namespace shapeforge {

CodeWriter& CodeWriter::line(const std::string& text) {
  size_t start = 0;
  while (true) {
    const size_t nl = text.find('\n', start);
    const std::string part = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    if (!part.empty()) out_.append(static_cast<size_t>(depth_ * indent_width_), ' ');
    out_ += part;
    out_ += '\n';
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  return *this;
}

CodeWriter& CodeWriter::blank() {
  out_ += '\n';
  return *this;
}

CodeWriter& CodeWriter::raw(const std::string& text) {
  out_ += text;
  return *this;
}

CodeWriter& CodeWriter::open_block(const std::string& header) {
  line(header + " {");
  ++depth_;
  return *this;
}

CodeWriter& CodeWriter::close_block(const std::string& suffix) {
  dedent();
  line("}" + suffix);
  return *this;
}

CodeWriter& CodeWriter::block(const std::string& header, const std::function<void(CodeWriter&)>& body,
                              const std::string& suffix) {
  open_block(header);
  body(*this);
  return close_block(suffix);
}

void CodeWriter::dedent() {
  if (depth_ == 0) throw Error(ErrorCode::invariant_violation, "unbalanced code block");
  --depth_;
}

std::string cpp_string_literal(const std::string& s) {
  std::string out = "\"";
  for (unsigned char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\%03o", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  out += '"';
  return out;
}

}  // namespace shapeforge
