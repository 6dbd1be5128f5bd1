#pragma once

// shapeforge/event_stream_harness.hpp: event-stream marshalling test harness.
//
// run_test_case() takes one protocol fixture through the whole pipeline:
//
//   1. OperationNormalizer, then EventStreamNormalizer
//   2. look up test#TestService, test#TestStreamOp and test#TestStream
//   3. backend.create_codegen_context()
//   4. generate_test_project(): errors, models and output modules
//   5. backend.render_generator(): marshaller and unmarshaller into lib
//   6. marshall or unmarshall checks into tests/lib_test.cpp
//   7. run the build/test command in the project directory
//
// The orchestrator only talks to EventStreamBackend. Client and server
// backends (backends.hpp) differ in builder fallibility and in how unknown
// events and unmodeled errors surface.
//
// A failing command throws CommandFailure with the captured output. There is
// no retry. Every run emits one HarnessEvent, failed runs included.

#include <memory>
#include <string>
#include <vector>

#include "shapeforge/event_stream_models.hpp"
#include "shapeforge/model.hpp"
#include "shapeforge/render.hpp"
#include "shapeforge/symbol.hpp"
#include "shapeforge/workspace.hpp"
#include "shapeforge/writer.hpp"

namespace shapeforge {

inline constexpr const char* kTestServiceId = "test#TestService";
inline constexpr const char* kTestOperationId = "test#TestStreamOp";
inline constexpr const char* kTestStreamUnionId = "test#TestStream";
inline constexpr const char* kTestInputOutputId = "test#TestStreamInputOutput";

enum class EventStreamTestVariety { marshall, unmarshall };

std::string to_string(EventStreamTestVariety variety);

struct CodegenContext {
  virtual ~CodegenContext() = default;

  std::shared_ptr<const Model> model;
  ShapeId service;
  ShapeId protocol;
  CodegenTarget target{CodegenTarget::client};
  std::shared_ptr<SymbolResolver> resolver;
  std::string crate_name;  // "event_stream_rest_json1"
};

class BuilderGenerator {
 public:
  virtual ~BuilderGenerator() = default;

  // "class S::Builder { ... };"
  virtual void render(CodeWriter& w) = 0;
  // "inline S::Builder S::builder()"
  virtual void render_convenience_method(CodeWriter& w) = 0;
};

struct EventStreamProtocol {
  Protocol protocol;
  PayloadFormat format;
  std::string content_type;
};

struct TestEventStreamProject {
  std::shared_ptr<const Model> model;
  const Shape* service{nullptr};
  const Shape* operation{nullptr};
  const Shape* output{nullptr};
  const Shape* stream_union{nullptr};
  std::vector<const Shape*> errors;  // operation errors, stream errors included
  std::unique_ptr<TestProject> project;
};

class EventStreamBackend {
 public:
  virtual ~EventStreamBackend() = default;

  virtual std::shared_ptr<CodegenContext> create_codegen_context(const Model& model, const Shape& service,
                                                                 const ShapeId& protocol_id,
                                                                 CodegenTarget target) const = 0;
  virtual std::unique_ptr<BuilderGenerator> create_builder_generator(const CodegenContext& ctx,
                                                                     const Shape& structure) const = 0;
  virtual GeneratedCodec render_generator(const CodegenContext& ctx, TestEventStreamProject& project,
                                          const EventStreamProtocol& protocol) const = 0;
  // Variant class "<op_symbol.name>Error" over `errors`.
  virtual void render_operation_error(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                                      const Symbol& op_symbol, const std::vector<const Shape*>& errors) const = 0;
};

// Structure, then its builder, then builder().
void render_with_model_builder(CodeWriter& w, const CodegenContext& ctx, const EventStreamBackend& backend,
                               const Shape& structure);

// Steps 2 and 4. The workspace is created here and removed with the project.
// Throws Error(shape_not_found) when the fixture names are missing and
// Error(unsupported_shape) for member targets that are neither structures
// nor unions.
TestEventStreamProject generate_test_project(const CodegenContext& ctx, const EventStreamBackend& backend);

// Step 6 writers. Message names and values match the fixture model.
void write_marshall_tests(TestProject& project, const EventStreamTestCase& test_case, const GeneratedCodec& codec);
void write_unmarshall_tests(TestProject& project, const EventStreamTestCase& test_case, const GeneratedCodec& codec,
                            CodegenTarget target);

// Returns the command output.
std::string run_test_case(const EventStreamTestCase& test_case, const EventStreamBackend& backend,
                          CodegenTarget target, EventStreamTestVariety variety, const std::string& command);
// Uses global_harness_config().build_command.
std::string run_test_case(const EventStreamTestCase& test_case, const EventStreamBackend& backend,
                          CodegenTarget target, EventStreamTestVariety variety);

}  // namespace shapeforge
