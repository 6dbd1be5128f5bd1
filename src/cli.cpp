#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "shapeforge/backends.hpp"
#include "shapeforge/config.hpp"
#include "shapeforge/constraints.hpp"
#include "shapeforge/event_stream_harness.hpp"
#include "shapeforge/event_stream_models.hpp"
#include "shapeforge/jsonlite.hpp"
#include "shapeforge/model_loader.hpp"
#include "shapeforge/protocol.hpp"
#include "shapeforge/settings.hpp"
#include "shapeforge/symbol.hpp"
#include "shapeforge/types.hpp"

namespace jsonlite = shapeforge::jsonlite;

namespace {

void usage() {
  std::cerr
      << "usage: shapeforge <command> [options]\n"
      << "  constraints --model <file> [--shape <id>] [--target client|server]\n"
      << "              [--private-constrained-types]\n"
      << "  settings [--debug-mode] [--public-constrained-types true|false]\n"
      << "  protocols\n"
      << "  event-stream --protocol <name> [--target client|server]\n"
      << "               [--variety marshall|unmarshall] [--command <cmd>]\n";
}

std::optional<shapeforge::CodegenTarget> parse_target(const std::string &s) {
  if (s == "client")
    return shapeforge::CodegenTarget::client;
  if (s == "server")
    return shapeforge::CodegenTarget::server;
  return std::nullopt;
}

jsonlite::Object constraint_report(const shapeforge::Shape &shape,
                                   const shapeforge::Model &model,
                                   const shapeforge::SymbolResolver &resolver) {
  jsonlite::Object o;
  o["shape"] = jsonlite::Value{shape.id.to_string()};
  o["type"] = jsonlite::Value{shapeforge::to_string(shape.type)};
  jsonlite::Array kinds;
  for (const auto kind : shapeforge::constraint_kinds(shape))
    kinds.push_back(jsonlite::Value{shapeforge::to_string(kind)});
  o["constraint_traits"] = jsonlite::Value{kinds};
  o["directly_constrained"] =
      jsonlite::Value{shapeforge::is_directly_constrained(shape, resolver)};
  o["can_reach_constrained_shape"] = jsonlite::Value{
      shapeforge::can_reach_constrained_shape(shape, model, resolver)};
  o["transitively_constrained_only"] =
      jsonlite::Value{shapeforge::is_transitively_but_not_directly_constrained(
          shape, model, resolver)};
  return o;
}

int cmd_constraints(int argc, char **argv) {
  std::string model_path, shape_id, target_name = "server";
  bool public_constrained_types = true;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--model" && i + 1 < argc)
      model_path = argv[++i];
    else if (a == "--shape" && i + 1 < argc)
      shape_id = argv[++i];
    else if (a == "--target" && i + 1 < argc)
      target_name = argv[++i];
    else if (a == "--private-constrained-types")
      public_constrained_types = false;
  }
  const auto target = parse_target(target_name);
  if (model_path.empty() || !target) {
    usage();
    return 1;
  }

  const shapeforge::Model model = shapeforge::load_model_file(model_path);
  const auto resolver =
      *target == shapeforge::CodegenTarget::client
          ? shapeforge::client_test_symbol_resolver(model)
          : shapeforge::server_test_symbol_resolver(model,
                                                    public_constrained_types);

  if (!shape_id.empty()) {
    std::cout << jsonlite::to_json(constraint_report(model.lookup(shape_id),
                                                     model, *resolver))
              << "\n";
    return 0;
  }
  for (const auto &[id, shape] : model.shapes()) {
    if (id.ns == shapeforge::kPreludeNamespace || shape.is_member())
      continue;
    std::cout << jsonlite::to_json(constraint_report(shape, model, *resolver))
              << "\n";
  }
  return 0;
}

int cmd_settings(int argc, char **argv) {
  shapeforge::AdditionalSettings settings;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--debug-mode")
      settings = settings.merge(
          shapeforge::AdditionalSettings::generate_codegen_comments(true));
    else if (a == "--public-constrained-types" && i + 1 < argc)
      settings =
          settings.merge(shapeforge::AdditionalSettings::public_constrained_types(
              std::string(argv[++i]) != "false"));
  }
  std::cout << jsonlite::to_json(settings.to_object()) << "\n";
  return 0;
}

int cmd_protocols() {
  jsonlite::Array ids;
  for (const auto p : shapeforge::all_protocols())
    ids.push_back(jsonlite::Value{shapeforge::protocol_trait_id(p)});
  jsonlite::Object o;
  o["protocols"] = jsonlite::Value{ids};
  std::cout << jsonlite::to_json(o) << "\n";
  return 0;
}

int cmd_event_stream(int argc, char **argv) {
  std::string protocol, target_name = "client", variety_name = "marshall";
  std::optional<std::string> command;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--protocol" && i + 1 < argc)
      protocol = argv[++i];
    else if (a == "--target" && i + 1 < argc)
      target_name = argv[++i];
    else if (a == "--variety" && i + 1 < argc)
      variety_name = argv[++i];
    else if (a == "--command" && i + 1 < argc)
      command = argv[++i];
  }
  const auto target = parse_target(target_name);
  if (!target || (variety_name != "marshall" && variety_name != "unmarshall")) {
    usage();
    return 1;
  }
  const auto variety = variety_name == "marshall"
                           ? shapeforge::EventStreamTestVariety::marshall
                           : shapeforge::EventStreamTestVariety::unmarshall;

  for (const auto &tc : shapeforge::event_stream_test_cases()) {
    const std::string &id = tc.protocol_shape_id;
    if (id != protocol && id.substr(id.find('#') + 1) != protocol)
      continue;
    const shapeforge::ClientBackend client{};
    const shapeforge::ServerBackend server{};
    const shapeforge::EventStreamBackend &backend =
        *target == shapeforge::CodegenTarget::client
            ? static_cast<const shapeforge::EventStreamBackend &>(client)
            : server;
    const std::string out =
        command ? shapeforge::run_test_case(tc, backend, *target, variety,
                                            *command)
                : shapeforge::run_test_case(tc, backend, *target, variety);
    std::cout << out;
    return 0;
  }
  std::cerr << "unknown event stream protocol '" << protocol << "'\n";
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  shapeforge::init_harness_config();

  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];

  try {
    if (cmd == "constraints")
      return cmd_constraints(argc, argv);
    if (cmd == "settings")
      return cmd_settings(argc, argv);
    if (cmd == "protocols")
      return cmd_protocols();
    if (cmd == "event-stream")
      return cmd_event_stream(argc, argv);
  } catch (const shapeforge::CommandFailure &e) {
    std::cerr << e.output();
    std::cerr << "{\"error\":\"" << shapeforge::to_string(e.code())
              << "\",\"command\":\"" << jsonlite::escape(e.command())
              << "\",\"exit_code\":" << e.exit_code() << "}\n";
    return 2;
  } catch (const shapeforge::Error &e) {
    std::cerr << "{\"error\":\"" << shapeforge::to_string(e.code())
              << "\",\"detail\":\"" << jsonlite::escape(e.detail()) << "\"}\n";
    return 2;
  }

  usage();
  return 1;
}
