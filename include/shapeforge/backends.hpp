#pragma once

// shapeforge/backends.hpp: client and server EventStreamBackend.
//
//                        client                 server
//   builders             infallible             fallible when the structure
//                                               can reach a constrained shape
//   unknown event        Unknown variant        UnmarshallError
//   unmodeled error      unhandled(payload)     UnmarshallError
//   operation error      + unhandled(string)    modeled errors only

#include <memory>
#include <string>
#include <vector>

#include "shapeforge/event_stream_harness.hpp"

namespace shapeforge {

// "event_stream_rest_json1" for aws.protocols#restJson1.
std::string event_stream_crate_name(const ShapeId& protocol_id);

class ClientBackend : public EventStreamBackend {
 public:
  // Throws Error(invariant_violation) unless target is client.
  std::shared_ptr<CodegenContext> create_codegen_context(const Model& model, const Shape& service,
                                                         const ShapeId& protocol_id,
                                                         CodegenTarget target) const override;
  std::unique_ptr<BuilderGenerator> create_builder_generator(const CodegenContext& ctx,
                                                             const Shape& structure) const override;
  GeneratedCodec render_generator(const CodegenContext& ctx, TestEventStreamProject& project,
                                  const EventStreamProtocol& protocol) const override;
  void render_operation_error(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                              const Symbol& op_symbol, const std::vector<const Shape*>& errors) const override;
};

class ServerBackend : public EventStreamBackend {
 public:
  explicit ServerBackend(bool public_constrained_types = true)
      : public_constrained_types_(public_constrained_types) {}

  // Throws Error(invariant_violation) unless target is server.
  std::shared_ptr<CodegenContext> create_codegen_context(const Model& model, const Shape& service,
                                                         const ShapeId& protocol_id,
                                                         CodegenTarget target) const override;
  std::unique_ptr<BuilderGenerator> create_builder_generator(const CodegenContext& ctx,
                                                             const Shape& structure) const override;
  GeneratedCodec render_generator(const CodegenContext& ctx, TestEventStreamProject& project,
                                  const EventStreamProtocol& protocol) const override;
  void render_operation_error(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                              const Symbol& op_symbol, const std::vector<const Shape*>& errors) const override;

 private:
  bool public_constrained_types_;
};

}  // namespace shapeforge
