#include "shapeforge/integration_test.hpp"

#include <system_error>
#include <utility>

#include "shapeforge/config.hpp"
#include "shapeforge/hash.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/sandbox.hpp"
#include "shapeforge/types.hpp"

namespace fs = std::filesystem;

namespace shapeforge {

namespace {

constexpr const char* kModuleAuthor = "test@shapeforge.dev";

jsonlite::Value str(const std::string& s) { return jsonlite::Value{s}; }

std::optional<std::string> default_service(const Model& model) {
  const auto services = model.shapes_of_type(ShapeType::service);
  if (services.empty()) return std::nullopt;
  return services.front()->id.to_string();
}

}  // namespace

GeneratedPluginContext generate_plugin_context(const Model& model, const IntegrationTestParams& params) {
  std::optional<TestWorkspace> workspace;
  fs::path dir;
  if (params.override_test_dir) {
    dir = *params.override_test_dir;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw Error(ErrorCode::io_error, "cannot create " + dir.string() + ": " + ec.message());
  } else {
    workspace.emplace(TestWorkspace::create("integration"));
    dir = workspace->path();
  }

  const std::string module = "test_" + hash_domain("ws:", dir.string()).substr(0, 8);

  jsonlite::Object settings;
  settings["module"] = str(module);
  settings["moduleVersion"] = str(params.module_version);
  settings["moduleAuthors"] = jsonlite::Value{jsonlite::Array{str(kModuleAuthor)}};
  if (auto service = params.service ? params.service : default_service(model)) settings["service"] = str(*service);
  if (params.runtime_config) settings["runtimeConfig"] = jsonlite::Value{*params.runtime_config};

  AdditionalSettings codegen = params.additional_settings;
  if (params.add_module_to_event_stream_allow_list) {
    jsonlite::Object allow;
    allow["eventStreamAllowList"] = jsonlite::Value{jsonlite::Array{str(module)}};
    jsonlite::Object wrapper;
    wrapper["codegen"] = jsonlite::Value{std::move(allow)};
    codegen = codegen.merge(AdditionalSettings(std::move(wrapper)));
  }
  settings = jsonlite::merge(settings, codegen.to_object());

  log_debug("integration", "plugin settings " + jsonlite::to_json(settings));
  return GeneratedPluginContext{
      PluginContext{std::make_shared<const Model>(model), std::move(settings), dir, FileManifest(dir)},
      std::move(workspace)};
}

fs::path codegen_integration_test(const Model& model, const IntegrationTestParams& params,
                                  const std::function<void(PluginContext&)>& invoke_plugin) {
  GeneratedPluginContext generated = generate_plugin_context(model, params);
  PluginContext& ctx = generated.context;

  HarnessEvent ev;
  ev.kind = "integration";
  ev.name = ctx.output_dir.string();

  try {
    {
      ScopeTimer timer(ev.generate_ns);
      write_strict_build_config(ctx.manifest);
      invoke_plugin(ctx);
      ctx.manifest.scan();
      ctx.manifest.log_generated_files();
    }
    ev.generated_files = ctx.manifest.entries().size();

    {
      ScopeTimer timer(ev.command_ns);
      if (params.command) {
        params.command(ctx.output_dir);
      } else {
        const std::string command = params.build_command.value_or(global_harness_config().build_command);
        const ProcessResult r = run_shell_command(command, ctx.output_dir.string());
        log_debug("integration", r.output);
        if (r.exit_code != 0) throw CommandFailure(command, r.exit_code, r.output);
      }
    }
    ev.ok = true;
    emit_harness_event(ev);
  } catch (const Error& e) {
    ev.error_code = to_string(e.code());
    log_warn("integration", ctx.output_dir.string() + " failed: " + e.what());
    emit_harness_event(ev);
    throw;
  } catch (const std::exception& e) {
    ev.error_code = "unexpected";
    log_warn("integration", ctx.output_dir.string() + " failed: " + e.what());
    emit_harness_event(ev);
    throw;
  }

  if (generated.workspace) generated.workspace->release();
  return ctx.output_dir;
}

}  // namespace shapeforge
