#include "shapeforge/event_stream_harness.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "shapeforge/config.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/normalize.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

// Post-order: a shape is rendered after everything it references, so every
// generated definition precedes its first use.
void render_member_targets(CodeWriter& w, const CodegenContext& ctx, const EventStreamBackend& backend,
                           const Shape& shape, std::set<ShapeId>& visited) {
  const Model& model = *ctx.model;
  for (const Shape* m : model.members(shape)) {
    const Shape& target = model.target_of(*m);
    if (target.id.ns == kPreludeNamespace) continue;
    if (!visited.insert(target.id).second) continue;
    switch (target.type) {
      case ShapeType::structure:
        if (target.has_trait<ErrorTrait>()) break;
        render_member_targets(w, ctx, backend, target, visited);
        render_with_model_builder(w, ctx, backend, target);
        w.blank();
        break;
      case ShapeType::union_:
        render_member_targets(w, ctx, backend, target, visited);
        render_union(w, model, *ctx.resolver, target, render_unknown_variant(ctx.target));
        w.blank();
        break;
      default:
        throw Error(ErrorCode::unsupported_shape, m->id.to_string() + " targets " + to_string(target.type) +
                                                      " shape " + target.id.to_string());
    }
  }
}

struct FixtureMessage {
  std::string member;   // union member name and :event-type
  std::string factory;  // variant factory on models::TestStream
  std::string value;    // expression building the event structure
  std::vector<std::pair<std::string, std::string>> headers;  // header name, HeaderValue expression
  std::string content_type;  // empty when the message has no payload
  std::string payload;
};

std::vector<FixtureMessage> fixture_messages(const EventStreamTestCase& tc) {
  return {
      {"MessageWithBlob", "message_with_blob",
       "models::MessageWithBlob::builder().data(runtime::blob_from(\"hello, world!\")).build()", {},
       "application/octet-stream", "hello, world!"},
      {"MessageWithString", "message_with_string",
       "models::MessageWithString::builder().data(\"hello, world!\").build()", {}, "text/plain", "hello, world!"},
      {"MessageWithStruct", "message_with_struct",
       "models::MessageWithStruct::builder()\n"
       "    .some_struct(models::TestStruct::builder().some_int(5).some_string(\"hello\").build())\n"
       "    .build()",
       {}, tc.media_type, tc.valid_test_struct},
      {"MessageWithUnion", "message_with_union",
       "models::MessageWithUnion::builder().some_union(models::TestUnion::foo(\"hello\")).build()", {},
       tc.media_type, tc.valid_test_union},
      {"MessageWithHeaders", "message_with_headers",
       "models::MessageWithHeaders::builder()\n"
       "    .blob(runtime::blob_from(\"test\"))\n"
       "    .boolean(true)\n"
       "    .int_(123)\n"
       "    .long_(9001)\n"
       "    .string(\"test\")\n"
       "    .build()",
       {{"blob", "runtime::blob_from(\"test\")"},
        {"boolean", "true"},
        {"int", "std::int32_t{123}"},
        {"long", "std::int64_t{9001}"},
        {"string", "std::string(\"test\")"}},
       "", ""},
      {"MessageWithHeaderAndPayload", "message_with_header_and_payload",
       "models::MessageWithHeaderAndPayload::builder()\n"
       "    .header(\"header\")\n"
       "    .payload(runtime::blob_from(\"payload\"))\n"
       "    .build()",
       {{"header", "std::string(\"header\")"}}, "application/octet-stream", "payload"},
      {"MessageWithNoHeaderPayloadTraits", "message_with_no_header_payload_traits",
       "models::MessageWithNoHeaderPayloadTraits::builder().some_int(5).some_string(\"hello\").build()", {},
       tc.media_type, tc.valid_message_with_no_header_payload_traits},
  };
}

void open_scope(CodeWriter& w) {
  w.line("{");
  w.indent();
}

void close_scope(CodeWriter& w) {
  w.dedent();
  w.line("}");
}

std::string check(const std::string& condition, const std::string& what) {
  return "check(" + condition + ", " + cpp_string_literal(what) + ");";
}

// Message with the given prelude headers and payload, named `message`.
void build_message(CodeWriter& w, const std::vector<std::pair<std::string, std::string>>& headers,
                   const std::string& payload) {
  w.line("runtime::Message message;");
  for (const auto& [name, value] : headers) {
    w.line("message.add_header(" + cpp_string_literal(name) + ", " + value + ");");
  }
  w.line("message.payload = " + cpp_string_literal(payload) + ";");
}

std::string str(const std::string& s) { return "std::string(" + cpp_string_literal(s) + ")"; }

}  // namespace

std::string to_string(EventStreamTestVariety variety) {
  return variety == EventStreamTestVariety::marshall ? "marshall" : "unmarshall";
}

void render_with_model_builder(CodeWriter& w, const CodegenContext& ctx, const EventStreamBackend& backend,
                               const Shape& structure) {
  render_structure(w, *ctx.model, *ctx.resolver, structure);
  w.blank();
  auto builder = backend.create_builder_generator(ctx, structure);
  builder->render(w);
  w.blank();
  builder->render_convenience_method(w);
}

TestEventStreamProject generate_test_project(const CodegenContext& ctx, const EventStreamBackend& backend) {
  const Model& model = *ctx.model;
  const SymbolResolver& resolver = *ctx.resolver;

  TestEventStreamProject out;
  out.model = ctx.model;
  out.service = &model.expect_shape(ctx.service, ShapeType::service);
  out.operation = &model.expect_shape(ShapeId::from(kTestOperationId), ShapeType::operation);
  out.stream_union = &model.expect_shape(ShapeId::from(kTestStreamUnionId), ShapeType::union_);
  const auto& bound = out.service->operations;
  if (std::find(bound.begin(), bound.end(), out.operation->id) == bound.end()) {
    throw Error(ErrorCode::model_invalid, std::string(kTestOperationId) + " is not bound to " + ctx.service.to_string());
  }
  if (!out.operation->input || !out.operation->output ||
      !out.stream_union->has_trait<SyntheticEventStreamUnionTrait>()) {
    throw Error(ErrorCode::model_invalid, std::string(kTestOperationId) + " was not normalized");
  }
  const Shape& input = model.expect_shape(*out.operation->input, ShapeType::structure);
  out.output = &model.expect_shape(*out.operation->output, ShapeType::structure);
  if (!input.has_trait<SyntheticInputOutputTrait>() || !out.output->has_trait<SyntheticInputOutputTrait>()) {
    throw Error(ErrorCode::model_invalid, std::string(kTestOperationId) + " was not normalized");
  }
  for (const auto& id : out.operation->errors) out.errors.push_back(&model.expect_shape(id, ShapeType::structure));

  std::vector<const Shape*> stream_errors;
  if (const auto* trait = out.stream_union->find_trait<SyntheticEventStreamUnionTrait>()) {
    for (const auto& err : trait->error_members) stream_errors.push_back(&model.expect_shape(err.target));
  }

  out.project = std::make_unique<TestProject>(ctx.crate_name, ctx.resolver, TestWorkspace::create(ctx.crate_name));
  TestProject& project = *out.project;

  project.with_module("runtime", [](CodeWriter& w) { w.raw(event_stream_runtime_source()); });

  project.with_module("errors", [&](CodeWriter& w) {
    for (const Shape* err : out.errors) {
      for (const Shape* m : model.members(*err)) {
        const Shape& target = model.target_of(*m);
        if (target.id.ns != kPreludeNamespace) {
          throw Error(ErrorCode::unsupported_shape,
                      m->id.to_string() + ": error members must target prelude shapes, not " + target.id.to_string());
        }
      }
      render_with_model_builder(w, ctx, backend, *err);
      w.blank();
    }
    backend.render_operation_error(w, model, resolver, resolver.to_symbol(*out.operation), out.errors);
    w.blank();
    backend.render_operation_error(w, model, resolver, resolver.to_symbol(*out.stream_union), stream_errors);
  });

  std::set<ShapeId> visited;
  project.with_module("models", [&](CodeWriter& w) {
    render_member_targets(w, ctx, backend, input, visited);
    render_member_targets(w, ctx, backend, *out.output, visited);
  });

  project.with_module("output", [&](CodeWriter& w) { render_with_model_builder(w, ctx, backend, *out.output); });

  log_debug("harness", "generated " + ctx.crate_name + " (" + to_string(ctx.target) + "): " +
                           std::to_string(visited.size()) + " model shapes, " + std::to_string(out.errors.size()) +
                           " errors");
  return out;
}

void write_marshall_tests(TestProject& project, const EventStreamTestCase& test_case, const GeneratedCodec& codec) {
  const auto messages = fixture_messages(test_case);
  project.with_test([&](CodeWriter& w) {
    w.line("const " + codec.marshaller + " marshaller{};");
    for (const auto& msg : messages) {
      open_scope(w);
      w.line("const runtime::Message message = marshaller.marshall(models::TestStream::" + msg.factory + "(");
      w.indent();
      w.indent();
      w.line(msg.value + "));");
      w.dedent();
      w.dedent();
      w.line(check("message.header_equals(\":message-type\", " + str("event") + ")", msg.member + " :message-type"));
      w.line(check("message.header_equals(\":event-type\", " + str(msg.member) + ")", msg.member + " :event-type"));
      for (const auto& [name, value] : msg.headers) {
        w.line(check("message.header_equals(" + cpp_string_literal(name) + ", " + value + ")",
                     msg.member + " header " + name));
      }
      if (msg.content_type.empty()) {
        w.line(check("message.header(\":content-type\") == nullptr", msg.member + " has no :content-type"));
      } else {
        w.line(check("message.header_equals(\":content-type\", " + str(msg.content_type) + ")",
                     msg.member + " :content-type"));
      }
      w.line(check("message.payload == " + cpp_string_literal(msg.payload), msg.member + " payload"));
      close_scope(w);
    }
  });
}

void write_unmarshall_tests(TestProject& project, const EventStreamTestCase& test_case, const GeneratedCodec& codec,
                            CodegenTarget target) {
  const auto messages = fixture_messages(test_case);
  const std::string& error_type = codec.error_type;
  project.with_test([&](CodeWriter& w) {
    w.line("const " + codec.unmarshaller + " unmarshaller{};");
    for (const auto& msg : messages) {
      open_scope(w);
      std::vector<std::pair<std::string, std::string>> headers = {{":message-type", str("event")},
                                                                  {":event-type", str(msg.member)}};
      headers.insert(headers.end(), msg.headers.begin(), msg.headers.end());
      if (!msg.content_type.empty()) headers.emplace_back(":content-type", str(msg.content_type));
      build_message(w, headers, msg.payload);
      w.line("const auto result = unmarshaller.unmarshall(message);");
      w.line("check(std::holds_alternative<models::TestStream>(result) &&");
      w.line("          std::get<models::TestStream>(result) == models::TestStream::" + msg.factory + "(");
      w.indent();
      w.indent();
      w.indent();
      w.line(msg.value + "),");
      w.dedent();
      w.dedent();
      w.dedent();
      w.line("      " + cpp_string_literal("unmarshall " + msg.member) + ");");
      close_scope(w);
    }

    open_scope(w);
    build_message(w,
                  {{":message-type", str("exception")},
                   {":exception-type", str("SomeError")},
                   {":content-type", str(test_case.media_type)}},
                  test_case.valid_some_error);
    w.line("const auto result = unmarshaller.unmarshall(message);");
    w.line("check(std::holds_alternative<" + error_type + ">(result) &&");
    w.line("          std::get<" + error_type + ">(result).is_some_error() &&");
    w.line("          std::get<" + error_type + ">(result).as_some_error().message == \"some error\",");
    w.line("      \"unmarshall SomeError\");");
    close_scope(w);

    const std::vector<std::pair<std::string, std::string>> unmodeled = {
        {":message-type", str("exception")},
        {":exception-type", str("UnmodeledError")},
        {":content-type", str(test_case.media_type)}};
    const std::vector<std::pair<std::string, std::string>> unknown_event = {{":message-type", str("event")},
                                                                            {":event-type", str("NotModeled")}};

    if (render_unknown_variant(target)) {
      open_scope(w);
      build_message(w, unmodeled, test_case.valid_unmodeled_error);
      w.line("const auto result = unmarshaller.unmarshall(message);");
      w.line("check(std::holds_alternative<" + error_type + ">(result) &&");
      w.line("          std::get<" + error_type + ">(result).is_unhandled() &&");
      w.line("          std::get<" + error_type + ">(result).as_unhandled() == message.payload,");
      w.line("      \"unmodeled error surfaces as unhandled\");");
      close_scope(w);

      open_scope(w);
      build_message(w, unknown_event, "");
      w.line("const auto result = unmarshaller.unmarshall(message);");
      w.line(check("std::holds_alternative<models::TestStream>(result) && "
                   "std::get<models::TestStream>(result).is_unknown()",
                   "unknown event surfaces as unknown"));
      close_scope(w);
    } else {
      const std::vector<std::pair<std::string, std::vector<std::pair<std::string, std::string>>>> rejected = {
          {"unmodeled error is rejected", unmodeled}, {"unknown event is rejected", unknown_event}};
      for (const auto& [what, message_headers] : rejected) {
        open_scope(w);
        build_message(w, message_headers,
                      message_headers == unmodeled ? test_case.valid_unmodeled_error : std::string());
        w.line("bool threw = false;");
        w.open_block("try");
        w.line("(void)unmarshaller.unmarshall(message);");
        w.close_block(" catch (const runtime::UnmarshallError&) {");
        w.indent();
        w.line("threw = true;");
        close_scope(w);
        w.line(check("threw", what));
        close_scope(w);
      }
    }
  });
}

std::string run_test_case(const EventStreamTestCase& test_case, const EventStreamBackend& backend,
                          CodegenTarget target, EventStreamTestVariety variety, const std::string& command) {
  HarnessEvent ev;
  ev.kind = "event_stream";
  ev.name = test_case.to_string();
  ev.target = to_string(target);
  ev.variety = to_string(variety);
  log_info("harness", ev.name + " " + ev.target + " " + ev.variety);

  TestEventStreamProject generated;
  try {
    {
      ScopeTimer timer(ev.generate_ns);
      const Model model = EventStreamNormalizer::transform(OperationNormalizer::transform(test_case.model));
      const Shape& service = model.lookup(kTestServiceId);
      const auto ctx = backend.create_codegen_context(model, service, ShapeId::from(test_case.protocol_shape_id),
                                                      target);
      generated = generate_test_project(*ctx, backend);
      const EventStreamProtocol protocol{test_case.protocol, payload_format(test_case.protocol),
                                        test_case.media_type};
      const GeneratedCodec codec = backend.render_generator(*ctx, generated, protocol);
      if (variety == EventStreamTestVariety::marshall) {
        write_marshall_tests(*generated.project, test_case, codec);
      } else {
        write_unmarshall_tests(*generated.project, test_case, codec, target);
      }
    }

    std::string output;
    {
      ScopeTimer timer(ev.command_ns);
      output = generated.project->compile_and_test(command);
    }
    ev.generated_files = generated.project->manifest().entries().size();
    ev.ok = true;
    emit_harness_event(ev);
    return output;
  } catch (const Error& e) {
    if (generated.project) ev.generated_files = generated.project->manifest().entries().size();
    ev.error_code = to_string(e.code());
    log_warn("harness", ev.name + " " + ev.target + " " + ev.variety + " failed: " + e.what());
    emit_harness_event(ev);
    throw;
  } catch (const std::exception& e) {
    ev.error_code = "unexpected";
    log_warn("harness", ev.name + " " + ev.target + " " + ev.variety + " failed: " + e.what());
    emit_harness_event(ev);
    throw;
  }
}

std::string run_test_case(const EventStreamTestCase& test_case, const EventStreamBackend& backend,
                          CodegenTarget target, EventStreamTestVariety variety) {
  return run_test_case(test_case, backend, target, variety, global_harness_config().build_command);
}

}  // namespace shapeforge
