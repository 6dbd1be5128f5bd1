#pragma once

// shapeforge/writer.hpp: indented text buffer for generated C++.

#include <functional>
#include <string>

namespace shapeforge {

class CodeWriter {
 public:
  explicit CodeWriter(int indent_width = 2) : indent_width_(indent_width) {}

  // Appends one line at the current indentation. Embedded newlines are split
  // and indented individually.
  CodeWriter& line(const std::string& text);
  CodeWriter& blank();
  // Appends text verbatim, without indentation.
  CodeWriter& raw(const std::string& text);

  // "header {" ... "}" + suffix
  CodeWriter& open_block(const std::string& header);
  CodeWriter& close_block(const std::string& suffix = "");
  CodeWriter& block(const std::string& header, const std::function<void(CodeWriter&)>& body,
                    const std::string& suffix = "");

  void indent() { ++depth_; }
  void dedent();

  const std::string& str() const { return out_; }
  bool empty() const { return out_.empty(); }

 private:
  int indent_width_;
  int depth_{0};
  std::string out_;
};

// C++ string literal for `s`, quotes included.
std::string cpp_string_literal(const std::string& s);

}  // namespace shapeforge
