#include "shapeforge/backends.hpp"

#include <utility>

#include "shapeforge/constraints.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

class StructureBuilderGenerator : public BuilderGenerator {
 public:
  StructureBuilderGenerator(const CodegenContext& ctx, const Shape& structure, bool fallible)
      : ctx_(ctx), structure_(structure), fallible_(fallible) {}

  void render(CodeWriter& w) override {
    render_builder(w, *ctx_.model, *ctx_.resolver, structure_, fallible_);
  }

  void render_convenience_method(CodeWriter& w) override {
    render_builder_accessor(w, *ctx_.resolver, structure_);
  }

 private:
  const CodegenContext& ctx_;
  const Shape& structure_;
  bool fallible_;
};

std::shared_ptr<CodegenContext> make_context(const Model& model, const Shape& service, const ShapeId& protocol_id,
                                             SymbolResolverConfig config) {
  auto ctx = std::make_shared<CodegenContext>();
  ctx->model = std::make_shared<const Model>(model);
  ctx->service = service.id;
  ctx->protocol = protocol_id;
  ctx->target = config.target;
  ctx->resolver = std::make_shared<CppSymbolResolver>(ctx->model, std::move(config));
  ctx->crate_name = event_stream_crate_name(protocol_id);
  return ctx;
}

void expect_target(CodegenTarget expected, CodegenTarget actual) {
  if (expected != actual) {
    throw Error(ErrorCode::invariant_violation,
                to_string(expected) + " backend cannot generate for target " + to_string(actual));
  }
}

std::vector<VariantCase> error_cases(const SymbolResolver& resolver, const std::vector<const Shape*>& errors) {
  std::vector<VariantCase> cases;
  for (const Shape* err : errors) {
    cases.push_back(VariantCase{escape_identifier(to_snake_case(err->id.name)), resolver.to_symbol(*err).qualified_name()});
  }
  return cases;
}

GeneratedCodec render_codec(const CodegenContext& ctx, TestEventStreamProject& project,
                            const EventStreamProtocol& protocol) {
  GeneratedCodec codec;
  project.project->lib([&](CodeWriter& w) {
    codec = render_event_stream_codec(w, *ctx.model, *ctx.resolver, *project.stream_union, protocol.format,
                                      protocol.content_type);
  });
  return codec;
}

}  // namespace

std::string event_stream_crate_name(const ShapeId& protocol_id) {
  return "event_stream_" + to_snake_case(protocol_id.name);
}

// ---------------------------------------------------------------------------
// ClientBackend
// ---------------------------------------------------------------------------

std::shared_ptr<CodegenContext> ClientBackend::create_codegen_context(const Model& model, const Shape& service,
                                                                      const ShapeId& protocol_id,
                                                                      CodegenTarget target) const {
  expect_target(CodegenTarget::client, target);
  SymbolResolverConfig config;
  config.target = CodegenTarget::client;
  return make_context(model, service, protocol_id, std::move(config));
}

std::unique_ptr<BuilderGenerator> ClientBackend::create_builder_generator(const CodegenContext& ctx,
                                                                          const Shape& structure) const {
  return std::make_unique<StructureBuilderGenerator>(ctx, structure, false);
}

GeneratedCodec ClientBackend::render_generator(const CodegenContext& ctx, TestEventStreamProject& project,
                                               const EventStreamProtocol& protocol) const {
  return render_codec(ctx, project, protocol);
}

void ClientBackend::render_operation_error(CodeWriter& w, const Model&, const SymbolResolver& resolver,
                                           const Symbol& op_symbol, const std::vector<const Shape*>& errors) const {
  auto cases = error_cases(resolver, errors);
  cases.push_back(VariantCase{"unhandled", "std::string"});
  render_variant_class(w, op_symbol.name + "Error", cases);
}

// ---------------------------------------------------------------------------
// ServerBackend
// ---------------------------------------------------------------------------

std::shared_ptr<CodegenContext> ServerBackend::create_codegen_context(const Model& model, const Shape& service,
                                                                      const ShapeId& protocol_id,
                                                                      CodegenTarget target) const {
  expect_target(CodegenTarget::server, target);
  SymbolResolverConfig config;
  config.target = CodegenTarget::server;
  config.public_constrained_types = public_constrained_types_;
  return make_context(model, service, protocol_id, std::move(config));
}

std::unique_ptr<BuilderGenerator> ServerBackend::create_builder_generator(const CodegenContext& ctx,
                                                                          const Shape& structure) const {
  const bool fallible = can_reach_constrained_shape(structure, *ctx.model, *ctx.resolver);
  log_debug("backend", structure.id.to_string() + (fallible ? " builder is fallible" : " builder is infallible"));
  return std::make_unique<StructureBuilderGenerator>(ctx, structure, fallible);
}

GeneratedCodec ServerBackend::render_generator(const CodegenContext& ctx, TestEventStreamProject& project,
                                               const EventStreamProtocol& protocol) const {
  return render_codec(ctx, project, protocol);
}

void ServerBackend::render_operation_error(CodeWriter& w, const Model&, const SymbolResolver& resolver,
                                           const Symbol& op_symbol, const std::vector<const Shape*>& errors) const {
  render_variant_class(w, op_symbol.name + "Error", error_cases(resolver, errors));
}

}  // namespace shapeforge
