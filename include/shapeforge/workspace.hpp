#pragma once

// shapeforge/workspace.hpp: generated test projects on disk.
//
// TestWorkspace owns one directory. It is removed when the workspace goes out
// of scope, on success and on failure alike, unless SHAPEFORGE_KEEP_WORKSPACE=1
// or release() was called.
//
// TestProject collects generated modules in memory and lays them out as a
// CMake project:
//
//   CMakeLists.txt
//   shapeforge-build.cmake   strict warnings (-Wall -Wextra -Werror)
//   src/runtime.hpp          event-stream message and payload codec
//   src/errors.hpp           namespace <crate>::errors
//   src/models.hpp           namespace <crate>::models
//   src/output.hpp           namespace <crate>::output
//   src/lib.hpp              namespace <crate>  (marshaller, unmarshaller)
//   tests/lib_test.cpp       executable registered with ctest
//
// Each module header includes the one before it in that list.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "shapeforge/symbol.hpp"
#include "shapeforge/writer.hpp"

namespace shapeforge {

inline constexpr const char* kStrictBuildConfigFile = "shapeforge-build.cmake";

class TestWorkspace {
 public:
  // Fresh directory "<root>/shapeforge-<prefix>-XXXXXX" where root is
  // SHAPEFORGE_WORKSPACE_ROOT or the system temp directory.
  // Throws Error(io_error).
  static TestWorkspace create(const std::string& prefix);

  TestWorkspace(std::filesystem::path dir, bool keep);
  ~TestWorkspace();

  TestWorkspace(TestWorkspace&& other) noexcept;
  TestWorkspace& operator=(TestWorkspace&& other) noexcept;
  TestWorkspace(const TestWorkspace&) = delete;
  TestWorkspace& operator=(const TestWorkspace&) = delete;

  const std::filesystem::path& path() const { return dir_; }
  // Leaves the directory on disk and returns it.
  std::filesystem::path release();

 private:
  void remove_now() noexcept;

  std::filesystem::path dir_;
  bool keep_{false};
};

struct ManifestEntry {
  std::string path;  // relative to the manifest root
  std::string blake3;
  std::uintmax_t size{0};
};

// Files written under one root, with their BLAKE3 digests.
class FileManifest {
 public:
  explicit FileManifest(std::filesystem::path root) : root_(std::move(root)) {}

  // Creates parent directories. Throws Error(io_error).
  void write_file(const std::string& relative, const std::string& contents);
  // Records a file something else wrote (a plugin). Throws Error(io_error)
  // when it does not exist.
  void record(const std::string& relative);
  // Records every regular file under the root that is not recorded yet.
  void scan();

  const std::vector<ManifestEntry>& entries() const { return entries_; }
  std::vector<std::string> files() const;
  // Digest over every (path, digest) pair, "file:" domain.
  std::string digest() const;
  void log_generated_files() const;

  const std::filesystem::path& root() const { return root_; }

 private:
  void upsert(ManifestEntry entry);

  std::filesystem::path root_;
  std::vector<ManifestEntry> entries_;
};

void write_strict_build_config(FileManifest& manifest);

class TestProject {
 public:
  static const std::vector<std::string>& module_names();

  TestProject(std::string crate_name, std::shared_ptr<SymbolResolver> resolver, TestWorkspace workspace);

  // Module is one of module_names(). Throws Error(invariant_violation) otherwise.
  void with_module(const std::string& module, const std::function<void(CodeWriter&)>& body);
  void lib(const std::function<void(CodeWriter&)>& body) { with_module("lib", body); }
  // Body of tests/lib_test.cpp, inside main().
  void with_test(const std::function<void(CodeWriter&)>& body);

  // Writes the project to disk and returns the manifest.
  const FileManifest& flush();
  // flush(), then runs `command` in the project directory. Throws
  // CommandFailure on a non-zero exit and returns the captured output otherwise.
  std::string compile_and_test(const std::string& command);
  std::string compile_and_test();

  const std::string& crate_name() const { return crate_name_; }
  const SymbolResolver& resolver() const { return *resolver_; }
  const std::filesystem::path& dir() const { return workspace_.path(); }
  TestWorkspace& workspace() { return workspace_; }
  const FileManifest& manifest() const { return manifest_; }

 private:
  std::string render_module(const std::string& module) const;
  std::string render_test() const;
  std::string render_cmake() const;

  std::string crate_name_;
  std::shared_ptr<SymbolResolver> resolver_;
  TestWorkspace workspace_;
  FileManifest manifest_;
  std::map<std::string, CodeWriter> modules_;
  CodeWriter test_body_;
};

}  // namespace shapeforge
