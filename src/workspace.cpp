#include "shapeforge/workspace.hpp"

#include <stdlib.h>

#include <algorithm>
#include <fstream>
#include <utility>

#include "shapeforge/config.hpp"
#include "shapeforge/hash.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/sandbox.hpp"
#include "shapeforge/types.hpp"

namespace fs = std::filesystem;

namespace shapeforge {

namespace {

constexpr const char* kGeneratedBanner = "// Generated by shapeforge. Do not edit.";

const char* const kStdIncludes[] = {"<cctype>", "<cstddef>", "<cstdint>", "<map>",     "<optional>",
                                    "<stdexcept>", "<string>", "<utility>", "<variant>", "<vector>"};

std::string short_id(const fs::path& dir) {
  return hash_domain("ws:", dir.string()).substr(0, 12);
}

}  // namespace

// ---------------------------------------------------------------------------
// TestWorkspace
// ---------------------------------------------------------------------------

TestWorkspace TestWorkspace::create(const std::string& prefix) {
  const HarnessConfig cfg = global_harness_config();
  std::error_code ec;
  fs::path root = cfg.workspace_root.empty() ? fs::temp_directory_path(ec) : fs::path(cfg.workspace_root);
  if (ec) throw Error(ErrorCode::io_error, "no temp directory: " + ec.message());
  fs::create_directories(root, ec);
  if (ec) throw Error(ErrorCode::io_error, "cannot create " + root.string() + ": " + ec.message());

  std::string tmpl = (root / ("shapeforge-" + prefix + "-XXXXXX")).string();
  if (mkdtemp(tmpl.data()) == nullptr) {
    throw Error(ErrorCode::io_error, "mkdtemp failed under " + root.string());
  }
  TestWorkspace ws(fs::path(tmpl), cfg.keep_workspace);
  log_debug("workspace", "created " + tmpl + " [" + short_id(ws.path()) + "]");
  return ws;
}

TestWorkspace::TestWorkspace(fs::path dir, bool keep) : dir_(std::move(dir)), keep_(keep) {}

TestWorkspace::~TestWorkspace() { remove_now(); }

TestWorkspace::TestWorkspace(TestWorkspace&& other) noexcept
    : dir_(std::move(other.dir_)), keep_(other.keep_) {
  other.dir_.clear();
}

TestWorkspace& TestWorkspace::operator=(TestWorkspace&& other) noexcept {
  if (this != &other) {
    remove_now();
    dir_ = std::move(other.dir_);
    keep_ = other.keep_;
    other.dir_.clear();
  }
  return *this;
}

fs::path TestWorkspace::release() {
  keep_ = true;
  return dir_;
}

void TestWorkspace::remove_now() noexcept {
  if (dir_.empty()) return;
  if (keep_) {
    log_info("workspace", "keeping " + dir_.string());
    return;
  }
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) log_warn("workspace", "could not remove " + dir_.string() + ": " + ec.message());
  dir_.clear();
}

// ---------------------------------------------------------------------------
// FileManifest
// ---------------------------------------------------------------------------

void FileManifest::write_file(const std::string& relative, const std::string& contents) {
  const fs::path full = root_ / relative;
  std::error_code ec;
  fs::create_directories(full.parent_path(), ec);
  if (ec) throw Error(ErrorCode::io_error, "cannot create " + full.parent_path().string());
  {
    std::ofstream ofs(full, std::ios::binary | std::ios::trunc);
    if (!ofs) throw Error(ErrorCode::io_error, "cannot write " + full.string());
    ofs << contents;
    if (!ofs) throw Error(ErrorCode::io_error, "short write to " + full.string());
  }
  record(relative);
}

void FileManifest::record(const std::string& relative) {
  const fs::path full = root_ / relative;
  std::error_code ec;
  const auto size = fs::file_size(full, ec);
  if (ec) throw Error(ErrorCode::io_error, "not a file: " + full.string());
  upsert(ManifestEntry{relative, hash_file_blake3_hex(full.string()), size});
}

void FileManifest::scan() {
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    const std::string rel = fs::relative(it->path(), root_).generic_string();
    const bool known = std::any_of(entries_.begin(), entries_.end(),
                                   [&](const ManifestEntry& e) { return e.path == rel; });
    if (!known) record(rel);
  }
  if (ec) throw Error(ErrorCode::io_error, "cannot scan " + root_.string() + ": " + ec.message());
}

void FileManifest::upsert(ManifestEntry entry) {
  auto it = std::lower_bound(entries_.begin(), entries_.end(), entry.path,
                             [](const ManifestEntry& e, const std::string& p) { return e.path < p; });
  if (it != entries_.end() && it->path == entry.path) {
    *it = std::move(entry);
  } else {
    entries_.insert(it, std::move(entry));
  }
}

std::vector<std::string> FileManifest::files() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.path);
  return out;
}

std::string FileManifest::digest() const {
  std::string payload;
  for (const auto& e : entries_) payload += e.path + ":" + e.blake3 + "\n";
  return hash_domain("file:", payload);
}

void FileManifest::log_generated_files() const {
  log_info("manifest", "generated " + std::to_string(entries_.size()) + " files under " + root_.string());
  for (const auto& e : entries_) {
    log_info("manifest", "  " + e.path + " " + std::to_string(e.size) + "B blake3:" + e.blake3.substr(0, 16));
  }
}

void write_strict_build_config(FileManifest& manifest) {
  manifest.write_file(kStrictBuildConfigFile,
                      "# Generated by shapeforge. Do not edit.\n"
                      "# Warnings are errors in generated test projects.\n"
                      "if(MSVC)\n"
                      "  add_compile_options(/W4 /WX)\n"
                      "else()\n"
                      "  add_compile_options(-Wall -Wextra -Werror)\n"
                      "endif()\n");
}

// ---------------------------------------------------------------------------
// TestProject
// ---------------------------------------------------------------------------

const std::vector<std::string>& TestProject::module_names() {
  static const std::vector<std::string> names = {"runtime", "errors", "models", "output", "lib"};
  return names;
}

TestProject::TestProject(std::string crate_name, std::shared_ptr<SymbolResolver> resolver,
                         TestWorkspace workspace)
    : crate_name_(std::move(crate_name)),
      resolver_(std::move(resolver)),
      workspace_(std::move(workspace)),
      manifest_(workspace_.path()) {
  for (const auto& m : module_names()) modules_.emplace(m, CodeWriter());
  test_body_.indent();
}

void TestProject::with_module(const std::string& module, const std::function<void(CodeWriter&)>& body) {
  auto it = modules_.find(module);
  if (it == modules_.end()) throw Error(ErrorCode::invariant_violation, "unknown module '" + module + "'");
  body(it->second);
}

void TestProject::with_test(const std::function<void(CodeWriter&)>& body) {
  body(test_body_);
}

std::string TestProject::render_module(const std::string& module) const {
  CodeWriter w;
  w.line("#pragma once").blank().line(kGeneratedBanner).blank();
  for (const char* inc : kStdIncludes) w.line(std::string("#include ") + inc);

  const auto& names = module_names();
  const auto pos = std::find(names.begin(), names.end(), module);
  if (pos != names.begin()) w.blank().line("#include \"" + *(pos - 1) + ".hpp\"");

  const std::string ns = module == "lib" ? crate_name_ : crate_name_ + "::" + module;
  w.blank().line("namespace " + ns + " {").blank();
  w.raw(modules_.at(module).str());
  w.blank().line("}  // namespace " + ns);
  return w.str();
}

std::string TestProject::render_test() const {
  CodeWriter w;
  w.line(kGeneratedBanner).blank();
  w.line("#include <cstdio>").line("#include <stdexcept>").line("#include <string>").blank();
  w.line("#include \"lib.hpp\"").blank();
  w.line("namespace {").blank().line("int g_failures = 0;").blank();
  w.block("[[maybe_unused]] void check(bool ok, const char* what)", [](CodeWriter& b) {
    b.block("if (!ok)", [](CodeWriter& c) {
      c.line("std::fprintf(stderr, \"FAIL: %s\\n\", what);");
      c.line("++g_failures;");
    });
  });
  w.blank().line("}  // namespace").blank();
  w.open_block("int main()");
  w.line("using namespace ::" + crate_name_ + ";");
  w.raw(test_body_.str());
  w.line("if (g_failures == 0) std::printf(\"all event stream checks passed\\n\");");
  w.line("return g_failures == 0 ? 0 : 1;");
  w.close_block();
  return w.str();
}

std::string TestProject::render_cmake() const {
  CodeWriter w;
  w.line("cmake_minimum_required(VERSION 3.16)");
  w.line("project(" + crate_name_ + " LANGUAGES CXX)");
  w.blank();
  w.line("set(CMAKE_CXX_STANDARD 20)");
  w.line("set(CMAKE_CXX_STANDARD_REQUIRED ON)");
  w.line(std::string("include(${CMAKE_CURRENT_SOURCE_DIR}/") + kStrictBuildConfigFile + ")");
  w.blank();
  w.line("add_library(" + crate_name_ + " INTERFACE)");
  w.line("target_include_directories(" + crate_name_ + " INTERFACE ${CMAKE_CURRENT_SOURCE_DIR}/src)");
  w.blank();
  w.line("enable_testing()");
  w.line("add_executable(lib_test tests/lib_test.cpp)");
  w.line("target_link_libraries(lib_test PRIVATE " + crate_name_ + ")");
  w.line("add_test(NAME lib_test COMMAND lib_test)");
  return w.str();
}

const FileManifest& TestProject::flush() {
  write_strict_build_config(manifest_);
  manifest_.write_file("CMakeLists.txt", render_cmake());
  for (const auto& m : module_names()) manifest_.write_file("src/" + m + ".hpp", render_module(m));
  manifest_.write_file("tests/lib_test.cpp", render_test());
  return manifest_;
}

std::string TestProject::compile_and_test(const std::string& command) {
  flush();
  const ProcessResult r = run_shell_command(command, dir().string());
  log_debug("workspace", r.output);
  if (r.exit_code != 0) throw CommandFailure(command, r.exit_code, r.output);
  return r.output;
}

std::string TestProject::compile_and_test() {
  return compile_and_test(global_harness_config().build_command);
}

}  // namespace shapeforge
