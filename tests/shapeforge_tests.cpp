#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <unistd.h>

#include "shapeforge/backends.hpp"
#include "shapeforge/config.hpp"
#include "shapeforge/constraints.hpp"
#include "shapeforge/event_stream_harness.hpp"
#include "shapeforge/event_stream_models.hpp"
#include "shapeforge/hash.hpp"
#include "shapeforge/integration_test.hpp"
#include "shapeforge/jsonlite.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/model_loader.hpp"
#include "shapeforge/normalize.hpp"
#include "shapeforge/protocol.hpp"
#include "shapeforge/sandbox.hpp"
#include "shapeforge/settings.hpp"
#include "shapeforge/symbol.hpp"
#include "shapeforge/types.hpp"
#include "shapeforge/workspace.hpp"
#include "shapeforge/writer.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;
std::string g_skip_reason;

fs::path g_workspace_root;
std::vector<shapeforge::HarnessEvent> g_events;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  g_skip_reason.clear();
  fn();
  if (!g_skip_reason.empty()) {
    std::cout << " SKIPPED (" << g_skip_reason << ")\n";
    g_tests_skipped++;
    return;
  }
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Marks the running test as skipped; the test returns right after.
void skip(const std::string& reason) { g_skip_reason = reason; }

void record_event(const shapeforge::HarnessEvent& ev) { g_events.push_back(ev); }

std::string read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool workspace_root_is_empty() {
  return fs::is_empty(g_workspace_root);
}

// Expects fn to throw shapeforge::Error with the given code.
template <typename Fn>
void expect_error(shapeforge::ErrorCode code, Fn&& fn, const std::string& message) {
  try {
    fn();
  } catch (const shapeforge::Error& e) {
    expect(e.code() == code, message + " (got " + shapeforge::to_string(e.code()) + ": " + e.detail() + ")");
    return;
  }
  expect(false, message + " (nothing thrown)");
}

constexpr const char* kConstraintsTestModel = R"({
  "smithy": "2.0",
  "shapes": {
    "test#TestService": {
      "type": "service",
      "version": "123",
      "operations": [{"target": "test#TestOperation"}]
    },
    "test#TestOperation": {
      "type": "operation",
      "input": {"target": "test#TestInputOutput"},
      "output": {"target": "test#TestInputOutput"}
    },
    "test#TestInputOutput": {
      "type": "structure",
      "members": {
        "map": {"target": "test#MapA"},
        "recursive": {"target": "test#RecursiveShape"}
      }
    },
    "test#RecursiveShape": {
      "type": "structure",
      "members": {
        "shape": {"target": "test#RecursiveShape"},
        "mapB": {"target": "test#MapB"}
      }
    },
    "test#MapA": {
      "type": "map",
      "key": {"target": "smithy.api#String"},
      "value": {"target": "test#MapB"},
      "traits": {"smithy.api#length": {"min": 1, "max": 69}}
    },
    "test#MapB": {
      "type": "map",
      "key": {"target": "smithy.api#String"},
      "value": {"target": "test#StructureA"}
    },
    "test#ListA": {
      "type": "list",
      "member": {"target": "test#MyString"},
      "traits": {"smithy.api#uniqueItems": {}}
    },
    "test#MyString": {
      "type": "string",
      "traits": {"smithy.api#pattern": "\\w+"}
    },
    "test#LengthString": {
      "type": "string",
      "traits": {"smithy.api#length": {"min": 1, "max": 69}}
    },
    "test#StructureA": {
      "type": "structure",
      "members": {
        "int": {"target": "smithy.api#Integer", "traits": {"smithy.api#range": {"min": 1, "max": 69}}},
        "string": {"target": "smithy.api#String", "traits": {"smithy.api#required": {}}}
      }
    },
    "test#StructureB": {
      "type": "structure",
      "members": {
        "patternString": {"target": "smithy.api#String", "traits": {"smithy.api#pattern": "\\w+"}},
        "requiredString": {"target": "smithy.api#String", "traits": {"smithy.api#required": {}}},
        "mapA": {"target": "test#MapA"},
        "mapAPrecedence": {"target": "test#MapA", "traits": {"smithy.api#length": {"min": 1, "max": 5}}}
      }
    },
    "test#StructWithInnerDefault": {
      "type": "structure",
      "members": {
        "inner": {"target": "smithy.api#PrimitiveBoolean", "traits": {"smithy.api#default": false}}
      }
    }
  }
})";

const shapeforge::Model& constraints_test_model() {
  static const shapeforge::Model model = shapeforge::load_model_json(kConstraintsTestModel);
  return model;
}

// ============================================================================
// Constraint classification
// ============================================================================

void test_supported_constraint_traits_are_direct() {
  const auto& model = constraints_test_model();
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  for (const char* id : {"test#ListA", "test#MapA", "test#StructureA", "test#LengthString"}) {
    expect(shapeforge::is_directly_constrained(model.lookup(id), *resolver),
           std::string(id) + " must be directly constrained");
  }
}

void test_member_constraints_are_not_direct() {
  const auto& model = constraints_test_model();
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  for (const char* id : {"test#StructureA$int", "test#StructureA$string"}) {
    expect(!shapeforge::is_directly_constrained(model.lookup(id), *resolver),
           std::string(id) + " must not be directly constrained");
  }
}

void test_reachability_of_constrained_shapes() {
  const auto& model = constraints_test_model();
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  expect(shapeforge::can_reach_constrained_shape(model.lookup("test#MapA"), model, *resolver), "MapA reaches");
  expect(!shapeforge::can_reach_constrained_shape(model.lookup("test#StructureA$int"), model, *resolver),
         "StructureA$int targets an unconstrained Integer");
  for (const char* id : {"test#ListA", "test#TestInputOutput", "test#MapB", "test#RecursiveShape"}) {
    expect(shapeforge::can_reach_constrained_shape(model.lookup(id), model, *resolver),
           std::string(id) + " must reach a constrained shape");
  }
}

void test_recursion_without_escape_terminates() {
  const auto model = shapeforge::load_model_json(R"({
    "smithy": "2.0",
    "shapes": {
      "rec#R": {"type": "structure", "members": {"self": {"target": "rec#R"}}},
      "rec#A": {"type": "structure", "members": {"b": {"target": "rec#B"}}},
      "rec#B": {"type": "structure", "members": {"a": {"target": "rec#A"}}}
    }
  })");
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  for (const char* id : {"rec#R", "rec#R$self", "rec#A", "rec#B", "rec#B$a"}) {
    expect(!shapeforge::can_reach_constrained_shape(model.lookup(id), model, *resolver),
           std::string(id) + " has nothing constrained to reach");
  }
}

void test_default_trait_is_not_a_constraint() {
  const auto& model = constraints_test_model();
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  expect(!shapeforge::can_reach_constrained_shape(model.lookup("test#StructWithInnerDefault"), model, *resolver),
         "a defaulted member does not make its structure constrained");
  expect(!shapeforge::is_directly_constrained(model.lookup("smithy.api#PrimitiveBoolean"), *resolver),
         "PrimitiveBoolean carries only a default");
}

void test_client_members_stay_optional() {
  const auto& model = constraints_test_model();
  const auto client = shapeforge::client_test_symbol_resolver(model);
  expect(!shapeforge::is_directly_constrained(model.lookup("test#StructureA"), *client),
         "client builders never reject a missing required member");
  expect(shapeforge::is_directly_constrained(model.lookup("test#LengthString"), *client),
         "trait classification does not depend on the target");
}

void test_constraint_policy_table() {
  const auto& model = constraints_test_model();
  const auto defaults = shapeforge::ConstraintPolicy::defaults();
  expect(defaults.materializes(shapeforge::ShapeType::string, shapeforge::ConstraintKind::length), "string length");
  expect(defaults.materializes(shapeforge::ShapeType::list, shapeforge::ConstraintKind::unique_items),
         "list uniqueItems");
  expect(!defaults.materializes(shapeforge::ShapeType::double_, shapeforge::ConstraintKind::range),
         "double range is not materialized");
  expect(!defaults.materializes(shapeforge::ShapeType::structure, shapeforge::ConstraintKind::length),
         "structures have no trait constraints");

  shapeforge::SymbolResolverConfig cfg;
  cfg.policy.deny(shapeforge::ShapeType::string, shapeforge::ConstraintKind::length);
  const shapeforge::CppSymbolResolver resolver(std::make_shared<const shapeforge::Model>(model), cfg);
  expect(!shapeforge::is_directly_constrained(model.lookup("test#LengthString"), resolver),
         "a denied kind no longer constrains");
  expect(shapeforge::is_directly_constrained(model.lookup("test#MyString"), resolver), "pattern still allowed");
}

void test_member_constraint_or_target() {
  const auto& model = constraints_test_model();
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  expect(shapeforge::member_has_constraint_trait_or_target_has(model.lookup("test#StructureA$int"), model,
                                                               *resolver),
         "range on the member itself");
  expect(!shapeforge::member_has_constraint_trait_or_target_has(model.lookup("test#StructureA$string"), model,
                                                                *resolver),
         "required String member");
  expect(shapeforge::member_has_constraint_trait_or_target_has(model.lookup("test#TestInputOutput$map"), model,
                                                               *resolver),
         "member targeting MapA");
  expect_error(
      shapeforge::ErrorCode::model_invalid,
      [&] { (void)shapeforge::member_has_constraint_trait_or_target_has(model.lookup("test#MapA"), model, *resolver); },
      "non-member rejected");
}

void test_transitively_but_not_directly() {
  const auto& model = constraints_test_model();
  const auto resolver = shapeforge::server_test_symbol_resolver(model);
  expect(shapeforge::is_transitively_but_not_directly_constrained(model.lookup("test#MapB"), model, *resolver),
         "MapB is only transitively constrained");
  expect(shapeforge::is_transitively_but_not_directly_constrained(model.lookup("test#TestInputOutput"), model,
                                                                  *resolver),
         "TestInputOutput is only transitively constrained");
  expect(!shapeforge::is_transitively_but_not_directly_constrained(model.lookup("test#MapA"), model, *resolver),
         "MapA is directly constrained");
}

void test_symbol_mapping() {
  const auto& model = constraints_test_model();
  const auto server = shapeforge::server_test_symbol_resolver(model);
  const auto private_server = shapeforge::server_test_symbol_resolver(model, false);
  const auto client = shapeforge::client_test_symbol_resolver(model);

  const auto str_member = server->to_symbol(model.lookup("test#StructureA$string"));
  expect(!str_member.optional && str_member.declared_type() == "std::string", "required member on server");
  const auto int_member = server->to_symbol(model.lookup("test#StructureA$int"));
  expect(int_member.member_name == "int_", "keyword member escaped");
  expect(int_member.declared_type() == "std::optional<std::int32_t>", "optional int member");
  expect(client->to_symbol(model.lookup("test#StructureA$string")).optional, "client keeps required optional");

  const auto& length_string = model.lookup("test#LengthString");
  expect(server->to_symbol(length_string).qualified_name() == "models::LengthString", "public constrained type");
  expect(private_server->to_symbol(length_string).qualified_name() == "constrained::LengthStringConstrained",
         "crate-private constrained type");
  expect(client->to_symbol(length_string).qualified_name() == "std::string", "client uses the plain type");

  expect(server->to_symbol(model.lookup("test#ListA")).qualified_name() == "models::ListA", "constrained list");
  expect(client->to_symbol(model.lookup("test#ListA")).qualified_name() == "std::vector<std::string>",
         "client list");
  expect(server->to_symbol(model.lookup("test#MapB")).qualified_name() == "std::map<std::string, models::StructureA>",
         "unconstrained map of structures");
}

void test_identifier_helpers() {
  expect(shapeforge::to_snake_case("restJson1") == "rest_json1", "restJson1");
  expect(shapeforge::to_snake_case("awsJson1_0") == "aws_json1_0", "awsJson1_0");
  expect(shapeforge::to_snake_case("MessageWithHeaderAndPayload") == "message_with_header_and_payload",
         "CamelCase");
  expect(shapeforge::to_snake_case("HTTPServer") == "http_server", "acronym");
  expect(shapeforge::escape_identifier("int") == "int_", "keyword");
  expect(shapeforge::escape_identifier("some_int") == "some_int", "plain identifier");
  expect(shapeforge::event_stream_crate_name(shapeforge::ShapeId::from("aws.protocols#restJson1")) ==
             "event_stream_rest_json1",
         "crate name");

  const auto id = shapeforge::ShapeId::from("test#StructureA$int");
  expect(id.ns == "test" && id.name == "StructureA" && id.member == "int", "shape id parts");
  expect(id.to_string() == "test#StructureA$int", "shape id round trip");
  expect_error(shapeforge::ErrorCode::invalid_shape_id, [] { (void)shapeforge::ShapeId::from("NoNamespace"); },
               "missing namespace");
}

// ============================================================================
// Constraints model across protocols
// ============================================================================

void test_constraints_model_for_every_protocol() {
  const std::string path = shapeforge::default_constraints_model_path();
  for (const auto protocol : shapeforge::all_protocols()) {
    const auto loaded = shapeforge::load_constraints_model(protocol, path);
    const shapeforge::ShapeId& service_id = loaded.first;
    const shapeforge::Model& model = loaded.second;
    const std::string where = shapeforge::protocol_trait_id(protocol);

    const auto& service = model.expect_shape(service_id, shapeforge::ShapeType::service);
    size_t protocol_traits = 0;
    for (const auto& t : service.traits) {
      if (const auto* p = std::get_if<shapeforge::ProtocolTrait>(&t)) {
        ++protocol_traits;
        expect(p->protocol == protocol, where + ": wrong protocol trait");
      }
    }
    expect(protocol_traits == 1, where + ": exactly one protocol trait");

    const auto resolver = shapeforge::server_test_symbol_resolver(model);
    const auto direct = [&](const char* name) {
      return shapeforge::is_directly_constrained(model.lookup(std::string("com.amazonaws.constraints#") + name),
                                                 *resolver);
    };
    const auto reaches = [&](const char* name) {
      return shapeforge::can_reach_constrained_shape(
          model.lookup(std::string("com.amazonaws.constraints#") + name), model, *resolver);
    };

    for (const char* name : {"ConA", "ConB", "LengthString", "PatternString", "EnumString", "RangeInteger",
                             "LengthList", "ConBSet", "LengthMap", "LengthBlob", "RecursiveShapesInputOutputNested1",
                             "ValidationException"}) {
      expect(direct(name), where + ": " + name + " is directly constrained");
    }
    for (const char* name : {"RangeDouble", "ConBList", "ConBMap", "ConstrainedUnion",
                             "RecursiveShapesInputOutputNested2", "UnconstrainedInputOutput"}) {
      expect(!direct(name), where + ": " + name + " is not directly constrained");
    }
    for (const char* name : {"ConBList", "ConBMap", "ConstrainedUnion", "RecursiveShapesInputOutput",
                             "RecursiveShapesInputOutputNested2", "ConstrainedShapesOperationInputOutput"}) {
      expect(reaches(name), where + ": " + name + " reaches a constrained shape");
    }
    expect(!reaches("UnconstrainedInputOutput"), where + ": self-referencing structure terminates unconstrained");
    expect(!reaches("RangeDouble"), where + ": RangeDouble");
  }
}

void test_replace_protocol_is_idempotent() {
  const auto loaded =
      shapeforge::load_constraints_model(shapeforge::Protocol::rest_xml, shapeforge::default_constraints_model_path());
  const shapeforge::ShapeId& service_id = loaded.first;
  const shapeforge::Model& model = loaded.second;
  const auto protocol_traits = [&](const shapeforge::Model& m) {
    const auto& traits = m.expect_shape(service_id).traits;
    return std::count_if(traits.begin(), traits.end(), [](const shapeforge::Trait& t) {
      return std::holds_alternative<shapeforge::ProtocolTrait>(t);
    });
  };
  expect(protocol_traits(model) == 1, "fixture carries one protocol trait");

  const auto same = shapeforge::replace_protocol_trait(model, service_id, shapeforge::Protocol::rest_xml);
  const auto& service = same.expect_shape(service_id);
  expect(service.traits.size() == model.expect_shape(service_id).traits.size(), "no duplicated trait");
  expect(protocol_traits(same) == 1, "exactly one protocol trait after replacing restXml with restXml");
  const auto* trait = service.find_trait<shapeforge::ProtocolTrait>();
  expect(trait != nullptr && trait->protocol == shapeforge::Protocol::rest_xml, "restXml kept");

  const auto cbor = shapeforge::replace_protocol_trait(same, service_id, shapeforge::Protocol::rpcv2_cbor);
  expect(protocol_traits(cbor) == 1, "switching protocols keeps a single trait");
  expect(cbor.expect_shape(service_id).find_trait<shapeforge::ProtocolTrait>()->protocol ==
             shapeforge::Protocol::rpcv2_cbor,
         "rpcv2Cbor set");
}

void test_remove_operations() {
  const auto loaded =
      shapeforge::load_constraints_model(shapeforge::Protocol::rest_json_1, shapeforge::default_constraints_model_path());
  const shapeforge::ShapeId& service_id = loaded.first;
  const shapeforge::Model& model = loaded.second;
  const auto unconstrained = shapeforge::ShapeId::from("com.amazonaws.constraints#UnconstrainedShapesOperation");
  const auto changed = shapeforge::remove_operations(model, service_id, {unconstrained});
  const auto& ops = changed.expect_shape(service_id).operations;
  expect(ops.size() == 2, "two operations remain");
  expect(!shapeforge::contains_any_shape_id(ops, {unconstrained}), "removed operation unbound");
  expect(changed.contains(unconstrained), "the operation shape itself stays in the model");

  expect_error(
      shapeforge::ErrorCode::invariant_violation,
      [&] {
        (void)shapeforge::remove_operations(changed, service_id, {unconstrained});
      },
      "operation must be bound before removal");
  expect_error(
      shapeforge::ErrorCode::invariant_violation,
      [&] {
        (void)shapeforge::remove_operations(model, service_id, model.expect_shape(service_id).operations);
      },
      "a service keeps at least one operation");
}

void test_remove_shapes() {
  const auto loaded =
      shapeforge::load_constraints_model(shapeforge::Protocol::aws_json_1_0, shapeforge::default_constraints_model_path());
  const shapeforge::ShapeId& service_id = loaded.first;
  const shapeforge::Model& model = loaded.second;
  const auto con_b = shapeforge::ShapeId::from("com.amazonaws.constraints#ConB");
  const auto changed = shapeforge::remove_shapes(model, {con_b});
  expect(!changed.contains(con_b), "ConB removed");
  expect(changed.expect_shape(service_id).operations.size() == 3, "service untouched");
  expect(!changed.contains(shapeforge::ShapeId::from("com.amazonaws.constraints#ConB$nice")), "its members too");
  expect(!changed.contains(shapeforge::ShapeId::from("com.amazonaws.constraints#ConA$conB")),
         "members targeting ConB removed");
  expect(changed.contains(shapeforge::ShapeId::from("com.amazonaws.constraints#ConA$lengthString")),
         "unrelated members kept");

  expect_error(
      shapeforge::ErrorCode::shape_not_found,
      [&] { (void)shapeforge::remove_shapes(model, {shapeforge::ShapeId::from("com.amazonaws.constraints#Nope")}); },
      "unknown shape id");

  expect(!changed.contains(shapeforge::ShapeId::from("com.amazonaws.constraints#ConBList")),
         "list of ConB cannot outlive its member");
  expect(!changed.contains(shapeforge::ShapeId::from("com.amazonaws.constraints#ConBMap")), "map of ConB too");
}

void test_remove_shapes_cascades_through_collections() {
  const auto model = shapeforge::load_model_json(R"({
    "smithy": "2.0",
    "shapes": {
      "t#S": {"type": "structure", "members": {"name": {"target": "smithy.api#String"}}},
      "t#L": {"type": "list", "member": {"target": "t#S"}},
      "t#LL": {"type": "list", "member": {"target": "t#L"}},
      "t#M": {"type": "map", "key": {"target": "smithy.api#String"}, "value": {"target": "t#S"}},
      "t#Holder": {
        "type": "structure",
        "members": {
          "list": {"target": "t#LL"},
          "map": {"target": "t#M"},
          "text": {"target": "smithy.api#String"}
        }
      }
    }
  })");
  const auto changed = shapeforge::remove_shapes(model, {shapeforge::ShapeId::from("t#S")});
  for (const char* id : {"t#S", "t#S$name", "t#L", "t#L$member", "t#LL", "t#M", "t#M$key", "t#Holder$list",
                         "t#Holder$map"}) {
    expect(!changed.contains(shapeforge::ShapeId::from(id)), std::string(id) + " removed");
  }
  const auto& holder = changed.lookup("t#Holder");
  expect(holder.member_ids.size() == 1, "Holder keeps its unrelated member");
  const auto resolver = shapeforge::server_test_symbol_resolver(changed);
  expect(resolver->to_symbol(holder).name == "Holder", "remaining model still resolves");
  for (const auto* member : changed.members(holder)) (void)resolver->to_symbol(*member);
}

void test_contains_any_shape_id() {
  const auto a = shapeforge::ShapeId::from("x#A");
  const auto b = shapeforge::ShapeId::from("x#B");
  const auto c = shapeforge::ShapeId::from("x#C");
  expect(shapeforge::contains_any_shape_id({a, b}, {c, b}), "shares B");
  expect(!shapeforge::contains_any_shape_id({a, b}, {c}), "no overlap");
  expect(!shapeforge::contains_any_shape_id({a, b}, {}), "empty ids");
}

// ============================================================================
// Model loading
// ============================================================================

void test_prelude_shapes() {
  const auto prelude = shapeforge::prelude_model();
  const auto& boolean = prelude.lookup("smithy.api#PrimitiveBoolean");
  expect(boolean.type == shapeforge::ShapeType::boolean, "PrimitiveBoolean type");
  expect(shapeforge::has_non_null_default(boolean), "PrimitiveBoolean default");
  expect(!shapeforge::has_non_null_default(prelude.lookup("smithy.api#Boolean")), "boxed Boolean");
}

void test_loader_errors() {
  expect_error(shapeforge::ErrorCode::json_parse_error, [] { (void)shapeforge::load_model_json("{"); },
               "truncated document");
  expect_error(shapeforge::ErrorCode::json_duplicate_key,
               [] { (void)shapeforge::load_model_json(R"({"smithy": "2.0", "smithy": "2.0"})"); }, "duplicate key");
  expect_error(shapeforge::ErrorCode::model_invalid,
               [] { (void)shapeforge::load_model_json(R"({"shapes": {}})"); }, "missing version");
  expect_error(
      shapeforge::ErrorCode::model_invalid,
      [] {
        (void)shapeforge::load_model_json(
            R"({"smithy": "2.0", "shapes": {"a#S": {"type": "structure", "members": {"m": {"target": "a#Missing"}}}}})");
      },
      "unresolved member target");
  expect_error(shapeforge::ErrorCode::io_error, [] { (void)shapeforge::load_model_file("/nonexistent/model.json"); },
               "missing file");
}

void test_loader_shapes() {
  const auto& model = constraints_test_model();
  const auto& structure_a = model.lookup("test#StructureA");
  const auto members = model.members(structure_a);
  expect(members.size() == 2, "StructureA members");
  expect(members[0]->member_name() == "int" && members[1]->member_name() == "string", "member order");
  expect(model.lookup("test#MapA").member_ids.size() == 2, "map key and value");

  const auto loaded =
      shapeforge::load_constraints_model(shapeforge::Protocol::rest_json_1, shapeforge::default_constraints_model_path());
  const shapeforge::Model& constraints = loaded.second;
  const auto& enum_string = constraints.lookup("com.amazonaws.constraints#EnumString");
  expect(enum_string.type == shapeforge::ShapeType::string, "enum becomes a string");
  const auto* values = enum_string.find_trait<shapeforge::EnumTrait>();
  expect(values != nullptr && values->values.size() == 2, "enum values");
  expect(constraints.lookup("com.amazonaws.constraints#ConBSet").has_trait<shapeforge::UniqueItemsTrait>(),
         "uniqueItems list");
}

// ============================================================================
// Normalization
// ============================================================================

void test_operation_normalizer() {
  const auto model = shapeforge::event_stream_model(shapeforge::Protocol::rest_json_1);
  const auto normalized = shapeforge::OperationNormalizer::transform(model);
  const auto op_id = shapeforge::ShapeId::from(shapeforge::kTestOperationId);
  const auto& op = normalized.expect_shape(op_id);
  expect(op.input == shapeforge::OperationNormalizer::synthetic_input_id(op_id), "synthetic input");
  expect(op.output == shapeforge::OperationNormalizer::synthetic_output_id(op_id), "synthetic output");
  expect(op.input->to_string() == "test.synthetic#TestStreamOpInput", "input id");

  const auto& input = normalized.expect_shape(*op.input);
  const auto* marker = input.find_trait<shapeforge::SyntheticInputOutputTrait>();
  expect(marker != nullptr && marker->operation == op_id, "synthetic trait names the operation");
  expect(marker->original && marker->original->to_string() == shapeforge::kTestInputOutputId, "original recorded");
  expect(shapeforge::event_stream_union(normalized, input) != nullptr, "input still streams");

  const auto again = shapeforge::OperationNormalizer::transform(normalized);
  expect(again.size() == normalized.size(), "second pass adds nothing");
  expect(again.expect_shape(op_id).input == op.input, "second pass keeps ids");
}

void test_event_stream_normalizer() {
  const auto model = shapeforge::EventStreamNormalizer::transform(
      shapeforge::OperationNormalizer::transform(shapeforge::event_stream_model(shapeforge::Protocol::rest_xml)));
  const auto& stream = model.lookup(shapeforge::kTestStreamUnionId);
  const auto* trait = stream.find_trait<shapeforge::SyntheticEventStreamUnionTrait>();
  expect(trait != nullptr, "stream union marked");
  expect(trait->error_members.size() == 1 && trait->error_members[0].name == "SomeError", "SomeError split off");
  for (const auto* m : model.members(stream)) expect(m->member_name() != "SomeError", "no error variant left");
  expect(model.members(stream).size() == 7, "seven event variants");

  const auto& op = model.lookup(shapeforge::kTestOperationId);
  size_t some_error = 0;
  for (const auto& e : op.errors) some_error += e.to_string() == "test#SomeError" ? 1 : 0;
  expect(some_error == 1, "stream error listed once on the operation");

  const auto again = shapeforge::EventStreamNormalizer::transform(model);
  expect(again.lookup(shapeforge::kTestOperationId).errors.size() == op.errors.size(), "idempotent");
}

// ============================================================================
// Settings, writer, logging
// ============================================================================

void test_settings_merge() {
  using shapeforge::AdditionalSettings;
  const auto merged = AdditionalSettings::merge(
      {AdditionalSettings::generate_codegen_comments(), AdditionalSettings::public_constrained_types(true),
       AdditionalSettings::public_constrained_types(false)});
  expect(shapeforge::jsonlite::to_json(merged.to_object()) ==
             R"({"codegen":{"debugMode":true,"publicConstrainedTypes":false}})",
         "nested merge, later wins: " + shapeforge::jsonlite::to_json(merged.to_object()));
  expect(AdditionalSettings().merge(merged) == merged, "empty is the identity");
}

void test_code_writer() {
  shapeforge::CodeWriter w;
  w.block("struct A", [](shapeforge::CodeWriter& b) { b.line("int x;"); }, ";");
  expect(w.str() == "struct A {\n  int x;\n};\n", "block layout: " + w.str());
  expect_error(shapeforge::ErrorCode::invariant_violation, [] { shapeforge::CodeWriter().dedent(); },
               "dedent below zero");
  expect(shapeforge::cpp_string_literal("a\"b\\\n") == "\"a\\\"b\\\\\\n\"", "string literal escaping");
}

void test_harness_event_json() {
  shapeforge::HarnessEvent ev;
  ev.kind = "event_stream";
  ev.name = "aws.protocols#restJson1";
  ev.target = "client";
  ev.ok = true;
  const std::string json = shapeforge::to_json(ev);
  expect(contains(json, "\"kind\":\"event_stream\""), "kind field");
  expect(contains(json, "\"name\":\"aws.protocols#restJson1\""), "name field");
  expect(contains(json, "\"ok\":true"), "ok field");
  expect(shapeforge::parse_log_level("debug") == shapeforge::LogLevel::debug, "debug level");
  expect(shapeforge::parse_log_level("bogus") == shapeforge::LogLevel::warn, "unknown level falls back to warn");
}

// ============================================================================
// Sandbox and workspaces
// ============================================================================

void test_json_surrogate_pairs() {
  std::optional<shapeforge::jsonlite::JsonError> err;
  const auto ok = shapeforge::jsonlite::parse(R"({"smile": "\ud83d\ude00"})", &err);
  expect(!err, "valid surrogate pair parses");
  expect(shapeforge::jsonlite::get_string(ok, "smile", "") == "\xF0\x9F\x98\x80", "pair decodes to one code point");

  for (const char* bad : {R"({"s": "\ud800\u0041"})", R"({"s": "\udbff\ud800"})"}) {
    err.reset();
    (void)shapeforge::jsonlite::parse(bad, &err);
    expect(err && err->code == "json_parse_error", std::string("rejects unpaired high surrogate: ") + bad);
  }
}

void test_config_snapshot_under_reinit() {
  const shapeforge::HarnessConfig saved = shapeforge::global_harness_config();
  shapeforge::HarnessConfig a = saved;
  a.build_command = "echo first-build-command-with-a-long-enough-text";
  shapeforge::HarnessConfig b = saved;
  b.build_command = "echo second";
  shapeforge::init_harness_config(a);

  std::atomic<bool> torn{false};
  std::vector<std::thread> readers;
  for (int t = 0; t < 8; ++t) {
    readers.emplace_back([&] {
      for (int i = 0; i < 2000; ++i) {
        const std::string cmd = shapeforge::global_harness_config().build_command;
        if (cmd != a.build_command && cmd != b.build_command) torn = true;
      }
    });
  }
  for (int i = 0; i < 2000; ++i) shapeforge::init_harness_config(i % 2 ? a : b);
  for (auto& r : readers) r.join();
  shapeforge::init_harness_config(saved);

  expect(!torn, "readers only ever see a complete config");
  expect(shapeforge::global_harness_config().build_command == saved.build_command, "config restored");
}

void test_shell_command_output_and_exit() {
  const auto r = shapeforge::run_shell_command("echo hello; echo oops 1>&2; exit 3", g_workspace_root.string());
  expect(r.exit_code == 3, "exit code propagated");
  expect(contains(r.output, "hello") && contains(r.output, "oops"), "stdout and stderr captured");
  expect(!r.timed_out, "no timeout");
}

void test_process_timeout_and_spawn_failure() {
  shapeforge::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 5"};
  spec.timeout_ms = 100;
  const auto slow = shapeforge::run_process(spec);
  expect(slow.timed_out && slow.exit_code == 124, "timeout reported as 124");

  shapeforge::ProcessSpec missing;
  missing.command = "/nonexistent/binary";
  expect(shapeforge::run_process(missing).exit_code == 127, "exec failure reported as 127");
}

void test_workspace_lifetime() {
  fs::path dir;
  {
    auto ws = shapeforge::TestWorkspace::create("lifetime");
    dir = ws.path();
    expect(fs::is_directory(dir), "workspace created");
    auto moved = std::move(ws);
    expect(moved.path() == dir, "move keeps the directory");
  }
  if (!shapeforge::global_harness_config().keep_workspace) {
    expect(!fs::exists(dir), "workspace removed on destruction");
  }

  fs::path kept;
  {
    auto ws = shapeforge::TestWorkspace::create("release");
    kept = ws.release();
  }
  expect(fs::is_directory(kept), "released workspace survives");
  fs::remove_all(kept);
}

void test_file_manifest() {
  auto ws = shapeforge::TestWorkspace::create("manifest");
  shapeforge::FileManifest manifest(ws.path());
  manifest.write_file("src/a.hpp", "#pragma once\n");
  expect(manifest.entries().size() == 1, "one entry");
  expect(manifest.entries()[0].blake3 == shapeforge::blake3_hex("#pragma once\n"), "content hash");
  expect(manifest.entries()[0].size == 13, "size recorded");
  const std::string before = manifest.digest();
  expect(before.size() == 64, "digest is 64 hex chars");

  std::ofstream(ws.path() / "extra.txt") << "side effect";
  manifest.scan();
  const auto files = manifest.files();
  expect(files.size() == 2 && files[0] == "extra.txt" && files[1] == "src/a.hpp", "scan finds plugin output");
  expect(manifest.digest() != before, "digest tracks contents");

  manifest.write_file("src/a.hpp", "#pragma once\n");
  expect(manifest.entries().size() == 2, "rewrite replaces the entry");
}

void test_test_project_layout() {
  const auto& model = constraints_test_model();
  shapeforge::TestProject project("layout_check", shapeforge::server_test_symbol_resolver(model),
                                  shapeforge::TestWorkspace::create("layout"));
  expect_error(
      shapeforge::ErrorCode::invariant_violation,
      [&] { project.with_module("nope", [](shapeforge::CodeWriter&) {}); }, "unknown module");
  project.with_module("models", [](shapeforge::CodeWriter& w) { w.line("struct Marker {};"); });
  project.with_test([](shapeforge::CodeWriter& w) { w.line("check(true, \"marker\");"); });
  const auto& manifest = project.flush();

  const auto files = manifest.files();
  for (const char* f : {"CMakeLists.txt", "shapeforge-build.cmake", "src/runtime.hpp", "src/errors.hpp",
                        "src/models.hpp", "src/output.hpp", "src/lib.hpp", "tests/lib_test.cpp"}) {
    expect(std::find(files.begin(), files.end(), f) != files.end(), std::string("generated ") + f);
  }
  const auto models = read_file(project.dir() / "src/models.hpp");
  expect(contains(models, "namespace layout_check::models {"), "module namespace");
  expect(contains(models, "#include \"errors.hpp\""), "module includes its predecessor");
  expect(contains(models, "struct Marker {};"), "module body");
  expect(contains(read_file(project.dir() / "src/lib.hpp"), "namespace layout_check {"), "lib namespace");
  expect(contains(read_file(project.dir() / "shapeforge-build.cmake"), "-Werror"), "warnings are errors");
  expect(contains(read_file(project.dir() / "tests/lib_test.cpp"), "check(true, \"marker\");"), "test body");

  expect(contains(project.compile_and_test("test -f CMakeLists.txt && echo built"), "built"), "command output");
  try {
    (void)project.compile_and_test("echo broken; exit 3");
    expect(false, "failing command must throw");
  } catch (const shapeforge::CommandFailure& e) {
    expect(e.exit_code() == 3, "exit code carried");
    expect(contains(e.output(), "broken"), "output carried");
    expect(e.code() == shapeforge::ErrorCode::command_failed, "command_failed code");
  }
}

// ============================================================================
// Event stream harness
// ============================================================================

const shapeforge::EventStreamTestCase& test_case_for(shapeforge::Protocol protocol) {
  for (const auto& tc : shapeforge::event_stream_test_cases()) {
    if (tc.protocol == protocol) return tc;
  }
  expect(false, "missing test case for " + shapeforge::protocol_trait_id(protocol));
  std::exit(1);
}

void test_event_stream_test_cases() {
  const auto& cases = shapeforge::event_stream_test_cases();
  expect(cases.size() == 4, "four protocols");
  const auto& rest_json = test_case_for(shapeforge::Protocol::rest_json_1);
  expect(rest_json.to_string() == "aws.protocols#restJson1", "display name");
  expect(rest_json.media_type == "application/json", "restJson1 media type");
  expect(test_case_for(shapeforge::Protocol::aws_json_1_1).media_type == "application/x-amz-json-1.1",
         "awsJson1_1 media type");
  expect(test_case_for(shapeforge::Protocol::rest_xml).media_type == "application/xml", "restXml media type");
  expect(shapeforge::payload_format(shapeforge::Protocol::rest_xml) == shapeforge::PayloadFormat::xml, "xml");
  expect(shapeforge::payload_format(shapeforge::Protocol::aws_json_1_0) == shapeforge::PayloadFormat::json, "json");
  expect_error(shapeforge::ErrorCode::unsupported_shape,
               [] { (void)shapeforge::payload_format(shapeforge::Protocol::rpcv2_cbor); }, "no cbor payloads");
}

struct GeneratedFiles {
  std::string errors;
  std::string models;
  std::string output;
  std::string lib;
  std::string test;
  shapeforge::GeneratedCodec codec;
};

GeneratedFiles generate_files(const shapeforge::EventStreamBackend& backend, shapeforge::CodegenTarget target,
                              shapeforge::Protocol protocol, shapeforge::EventStreamTestVariety variety) {
  const auto& tc = test_case_for(protocol);
  const auto model = shapeforge::EventStreamNormalizer::transform(shapeforge::OperationNormalizer::transform(tc.model));
  const auto ctx = backend.create_codegen_context(model, model.lookup(shapeforge::kTestServiceId),
                                                  shapeforge::ShapeId::from(tc.protocol_shape_id), target);
  auto generated = shapeforge::generate_test_project(*ctx, backend);
  GeneratedFiles files;
  files.codec = backend.render_generator(
      *ctx, generated, shapeforge::EventStreamProtocol{tc.protocol, shapeforge::payload_format(tc.protocol), tc.media_type});
  if (variety == shapeforge::EventStreamTestVariety::marshall) {
    shapeforge::write_marshall_tests(*generated.project, tc, files.codec);
  } else {
    shapeforge::write_unmarshall_tests(*generated.project, tc, files.codec, target);
  }
  generated.project->flush();
  const fs::path dir = generated.project->dir();
  files.errors = read_file(dir / "src/errors.hpp");
  files.models = read_file(dir / "src/models.hpp");
  files.output = read_file(dir / "src/output.hpp");
  files.lib = read_file(dir / "src/lib.hpp");
  files.test = read_file(dir / "tests/lib_test.cpp");
  return files;
}

void test_client_project_contents() {
  const shapeforge::ClientBackend client;
  const auto files = generate_files(client, shapeforge::CodegenTarget::client, shapeforge::Protocol::rest_json_1,
                                    shapeforge::EventStreamTestVariety::unmarshall);
  expect(files.codec.marshaller == "TestStreamMarshaller", "marshaller name");
  expect(files.codec.unmarshaller == "TestStreamUnmarshaller", "unmarshaller name");
  expect(files.codec.error_type == "errors::TestStreamError", "stream error type");

  expect(contains(files.models, "class TestStream {"), "stream union rendered");
  expect(contains(files.models, "static TestStream unknown()"), "client unions carry unknown");
  const auto inner = files.models.find("struct TestStruct {");
  const auto outer = files.models.find("struct MessageWithStruct {");
  expect(inner != std::string::npos && outer != std::string::npos && inner < outer, "children render first");
  expect(contains(files.models, "class TestUnion {"), "payload union rendered");
  expect(!contains(files.models, "BuildError"), "client builders are infallible");

  expect(contains(files.errors, "struct SomeError {"), "error structure");
  expect(contains(files.errors, "class TestStreamOpError {"), "operation error enum");
  expect(contains(files.errors, "class TestStreamError {"), "stream error enum");
  expect(contains(files.errors, "unhandled(std::string value)"), "client error enums carry unhandled");

  expect(contains(files.output, "struct TestStreamOpOutput {"), "output structure");
  expect(contains(files.lib, "kPayloadContentType = \"application/json\""), "content type constant");
  expect(contains(files.lib, "class TestStreamUnmarshaller {"), "unmarshaller rendered");
  expect(contains(files.test, "TestStreamUnmarshaller"), "unmarshall tests use the codec");
}

void test_server_project_contents() {
  const shapeforge::ServerBackend server;
  const auto files = generate_files(server, shapeforge::CodegenTarget::server, shapeforge::Protocol::rest_xml,
                                    shapeforge::EventStreamTestVariety::marshall);
  expect(!contains(files.models, "unknown()"), "server unions have no unknown variant");
  expect(!contains(files.errors, "unhandled("), "server error enums list modeled errors only");
  expect(contains(files.output, "throw runtime::BuildError"), "required stream member makes the builder fallible");
  expect(contains(files.lib, "kPayloadFormat = runtime::PayloadFormat::xml"), "xml payloads");
  expect(contains(files.lib, "kPayloadContentType = \"application/xml\""), "xml content type");
  expect(contains(files.test, "TestStreamMarshaller"), "marshall tests use the codec");
}

void test_backend_rejects_wrong_target() {
  const shapeforge::ClientBackend client;
  const shapeforge::ServerBackend server;
  const auto& tc = test_case_for(shapeforge::Protocol::aws_json_1_0);
  const auto model = shapeforge::EventStreamNormalizer::transform(shapeforge::OperationNormalizer::transform(tc.model));
  const auto& service = model.lookup(shapeforge::kTestServiceId);
  const auto protocol = shapeforge::ShapeId::from(tc.protocol_shape_id);
  expect_error(
      shapeforge::ErrorCode::invariant_violation,
      [&] { (void)client.create_codegen_context(model, service, protocol, shapeforge::CodegenTarget::server); },
      "client backend refuses server");
  expect_error(
      shapeforge::ErrorCode::invariant_violation,
      [&] { (void)server.create_codegen_context(model, service, protocol, shapeforge::CodegenTarget::client); },
      "server backend refuses client");
  const auto ctx = client.create_codegen_context(model, service, protocol, shapeforge::CodegenTarget::client);
  expect(ctx->crate_name == "event_stream_aws_json1_0", "context crate name");
  expect(ctx->resolver->target() == shapeforge::CodegenTarget::client, "context resolver target");
}

void test_unnormalized_model_rejected() {
  const shapeforge::ClientBackend client;
  const auto& tc = test_case_for(shapeforge::Protocol::rest_json_1);
  const auto ctx = client.create_codegen_context(tc.model, tc.model.lookup(shapeforge::kTestServiceId),
                                                 shapeforge::ShapeId::from(tc.protocol_shape_id),
                                                 shapeforge::CodegenTarget::client);
  expect_error(
      shapeforge::ErrorCode::model_invalid, [&] { (void)shapeforge::generate_test_project(*ctx, client); },
      "raw model must be normalized first");
}

constexpr const char* kFakeBuild =
    "test -f shapeforge-build.cmake && test -f CMakeLists.txt && test -f tests/lib_test.cpp && "
    "grep -q TestStreamMarshaller src/lib.hpp && grep -q TestStreamUnmarshaller src/lib.hpp && echo fake-build-ok";

void test_run_every_test_case() {
  const shapeforge::ClientBackend client;
  const shapeforge::ServerBackend server;
  g_events.clear();
  shapeforge::set_harness_event_hook(record_event);
  size_t runs = 0;
  for (const auto& tc : shapeforge::event_stream_test_cases()) {
    for (const auto target : {shapeforge::CodegenTarget::client, shapeforge::CodegenTarget::server}) {
      const shapeforge::EventStreamBackend& backend =
          target == shapeforge::CodegenTarget::client ? static_cast<const shapeforge::EventStreamBackend&>(client)
                                                      : server;
      for (const auto variety :
           {shapeforge::EventStreamTestVariety::marshall, shapeforge::EventStreamTestVariety::unmarshall}) {
        const std::string out = shapeforge::run_test_case(tc, backend, target, variety, kFakeBuild);
        expect(contains(out, "fake-build-ok"), tc.to_string() + " " + shapeforge::to_string(target) + " " +
                                                   shapeforge::to_string(variety));
        ++runs;
      }
    }
  }
  shapeforge::set_harness_event_hook(nullptr);
  expect(runs == 16, "four protocols, two targets, two varieties");
  expect(g_events.size() == runs, "one event per run");
  for (const auto& ev : g_events) {
    expect(ev.ok && ev.kind == "event_stream" && ev.error_code.empty(), "successful event for " + ev.name);
    expect(ev.generated_files == 8, "eight generated files for " + ev.name);
  }
  if (!shapeforge::global_harness_config().keep_workspace) {
    expect(workspace_root_is_empty(), "workspaces removed after each run");
  }
}

void test_run_test_case_reports_command_failure() {
  const shapeforge::ServerBackend server;
  g_events.clear();
  shapeforge::set_harness_event_hook(record_event);
  try {
    (void)shapeforge::run_test_case(test_case_for(shapeforge::Protocol::aws_json_1_1), server,
                                    shapeforge::CodegenTarget::server, shapeforge::EventStreamTestVariety::unmarshall,
                                    "echo compile error in lib_test.cpp; exit 3");
    expect(false, "failing build must throw");
  } catch (const shapeforge::CommandFailure& e) {
    expect(e.exit_code() == 3, "exit code carried");
    expect(contains(e.output(), "compile error"), "build output carried");
  }
  shapeforge::set_harness_event_hook(nullptr);
  expect(g_events.size() == 1, "one event");
  expect(!g_events[0].ok && g_events[0].error_code == "command_failed", "failure recorded");
  expect(g_events[0].target == "server" && g_events[0].variety == "unmarshall", "event identifies the run");
  if (!shapeforge::global_harness_config().keep_workspace) {
    expect(workspace_root_is_empty(), "failed workspace removed");
  }
}

void test_unsupported_member_target() {
  auto tc = test_case_for(shapeforge::Protocol::rest_json_1);
  std::string json = shapeforge::event_stream_model_json(shapeforge::Protocol::rest_json_1);
  const std::string value_member =
      R"("value": {"target": "test#TestStream", "traits": {"smithy.api#required": {}}})";
  const auto pos = json.find(value_member);
  expect(pos != std::string::npos, "fixture has the stream member");
  json.insert(pos + value_member.size(), R"(, "tags": {"target": "test#TagList"})");
  const std::string shapes = R"("shapes": {)";
  json.insert(json.find(shapes) + shapes.size(),
              R"("test#TagList": {"type": "list", "member": {"target": "smithy.api#String"}},)");
  tc.model = shapeforge::load_model_json(json);

  const shapeforge::ClientBackend client;
  g_events.clear();
  shapeforge::set_harness_event_hook(record_event);
  expect_error(
      shapeforge::ErrorCode::unsupported_shape,
      [&] {
        (void)shapeforge::run_test_case(tc, client, shapeforge::CodegenTarget::client,
                                        shapeforge::EventStreamTestVariety::marshall, "true");
      },
      "list member targets are not generated");
  shapeforge::set_harness_event_hook(nullptr);
  expect(g_events.size() == 1 && g_events[0].error_code == "unsupported_shape", "failure event");
}

// Builds the generated project for real. Only runs when a toolchain is
// available and SHAPEFORGE_REAL_BUILD=1.
void test_real_build() {
  const char* flag = std::getenv("SHAPEFORGE_REAL_BUILD");
  if (flag == nullptr || std::string(flag) != "1") {
    skip("set SHAPEFORGE_REAL_BUILD=1, or run the shapeforge_real_build test");
    return;
  }
  const shapeforge::ClientBackend client;
  const shapeforge::ServerBackend server;
  for (const auto& tc : shapeforge::event_stream_test_cases()) {
    (void)shapeforge::run_test_case(tc, client, shapeforge::CodegenTarget::client,
                                    shapeforge::EventStreamTestVariety::marshall);
    (void)shapeforge::run_test_case(tc, client, shapeforge::CodegenTarget::client,
                                    shapeforge::EventStreamTestVariety::unmarshall);
    (void)shapeforge::run_test_case(tc, server, shapeforge::CodegenTarget::server,
                                    shapeforge::EventStreamTestVariety::marshall);
    (void)shapeforge::run_test_case(tc, server, shapeforge::CodegenTarget::server,
                                    shapeforge::EventStreamTestVariety::unmarshall);
  }
}

// ============================================================================
// Integration driver
// ============================================================================

void test_plugin_context_settings() {
  const auto model = shapeforge::event_stream_model(shapeforge::Protocol::rest_json_1);
  shapeforge::IntegrationTestParams params;
  params.add_module_to_event_stream_allow_list = true;
  params.additional_settings = shapeforge::AdditionalSettings::generate_codegen_comments();
  shapeforge::jsonlite::Object runtime;
  runtime["relocate"] = shapeforge::jsonlite::Value{true};
  params.runtime_config = runtime;

  auto generated = shapeforge::generate_plugin_context(model, params);
  expect(generated.workspace.has_value(), "fresh workspace owned by the context");
  const auto& settings = generated.context.settings;
  const std::string module = shapeforge::jsonlite::get_string(settings, "module");
  expect(module.rfind("test_", 0) == 0 && module.size() == 13, "module name: " + module);
  expect(shapeforge::jsonlite::get_string(settings, "moduleVersion") == "1.0.0", "module version");
  expect(shapeforge::jsonlite::get_string_array(settings, "moduleAuthors").size() == 1, "module authors");
  expect(shapeforge::jsonlite::get_string(settings, "service") == shapeforge::kTestServiceId, "default service");
  const auto* runtime_config = shapeforge::jsonlite::get_object(settings, "runtimeConfig");
  expect(runtime_config != nullptr && shapeforge::jsonlite::get_bool(*runtime_config, "relocate"), "runtime config");

  const auto* codegen = shapeforge::jsonlite::get_object(settings, "codegen");
  expect(codegen != nullptr, "codegen block");
  expect(shapeforge::jsonlite::get_bool(*codegen, "debugMode"), "additional settings merged");
  const auto allow = shapeforge::jsonlite::get_string_array(*codegen, "eventStreamAllowList");
  expect(allow.size() == 1 && allow[0] == module, "module on the allow list");
  expect(generated.context.output_dir == generated.workspace->path(), "plugin writes into the workspace");

  shapeforge::IntegrationTestParams plain;
  plain.service = "test#Other";
  const auto other = shapeforge::generate_plugin_context(model, plain);
  expect(shapeforge::jsonlite::get_object(other.context.settings, "codegen") == nullptr, "no codegen block");
  expect(shapeforge::jsonlite::get_string(other.context.settings, "service") == "test#Other", "explicit service");
}

void test_integration_success() {
  const auto model = shapeforge::event_stream_model(shapeforge::Protocol::rest_xml);
  shapeforge::IntegrationTestParams params;
  params.build_command = "test -f src/lib.hpp && test -f shapeforge-build.cmake && echo integration-ok";
  bool invoked = false;
  const fs::path dir = shapeforge::codegen_integration_test(model, params, [&](shapeforge::PluginContext& ctx) {
    invoked = true;
    expect(ctx.model->contains(shapeforge::ShapeId::from(shapeforge::kTestStreamUnionId)), "plugin sees the model");
    std::ofstream(ctx.output_dir / "notes.txt") << "written outside the manifest";
    ctx.manifest.write_file("src/lib.hpp", "#pragma once\n");
  });
  expect(invoked, "plugin invoked");
  expect(fs::is_regular_file(dir / "src/lib.hpp") && fs::is_regular_file(dir / "notes.txt"),
         "output left for the caller");
  fs::remove_all(dir);
}

void test_integration_custom_command_and_dir() {
  const auto model = shapeforge::event_stream_model(shapeforge::Protocol::aws_json_1_0);
  const fs::path target = g_workspace_root / "override";
  shapeforge::IntegrationTestParams params;
  params.override_test_dir = target;
  fs::path seen;
  params.command = [&](const fs::path& dir) { seen = dir; };
  const fs::path dir = shapeforge::codegen_integration_test(
      model, params, [](shapeforge::PluginContext& ctx) { ctx.manifest.write_file("README", "generated\n"); });
  expect(dir == target && seen == target, "override directory used");
  expect(fs::is_regular_file(target / "README"), "plugin output present");
  fs::remove_all(target);
}

void test_integration_failure() {
  const auto model = shapeforge::event_stream_model(shapeforge::Protocol::aws_json_1_1);
  shapeforge::IntegrationTestParams params;
  params.build_command = "echo integration-broken; exit 7";
  g_events.clear();
  shapeforge::set_harness_event_hook(record_event);
  try {
    (void)shapeforge::codegen_integration_test(model, params, [](shapeforge::PluginContext&) {});
    expect(false, "failing command must throw");
  } catch (const shapeforge::CommandFailure& e) {
    expect(e.exit_code() == 7 && contains(e.output(), "integration-broken"), "failure diagnostics");
  }
  shapeforge::set_harness_event_hook(nullptr);
  expect(g_events.size() == 1 && g_events[0].kind == "integration" && !g_events[0].ok, "integration event");
  if (!shapeforge::global_harness_config().keep_workspace) {
    expect(workspace_root_is_empty(), "failed integration workspace removed");
  }
}

}  // namespace

int main() {
  g_workspace_root = fs::temp_directory_path() / ("shapeforge-tests-" + std::to_string(::getpid()));
  fs::remove_all(g_workspace_root);
  fs::create_directories(g_workspace_root);
  shapeforge::HarnessConfig config = shapeforge::HarnessConfig::from_env();
  config.workspace_root = g_workspace_root.string();
  config.timeout_ms = 0;
  shapeforge::init_harness_config(config);

  std::cout << "=== shapeforge test suite ===\n";

  std::cout << "\n[Constraints] classification and reachability\n";
  run_test("supported constraint traits are direct", test_supported_constraint_traits_are_direct);
  run_test("member constraints are not direct", test_member_constraints_are_not_direct);
  run_test("reachability of constrained shapes", test_reachability_of_constrained_shapes);
  run_test("recursion without escape terminates", test_recursion_without_escape_terminates);
  run_test("default trait is not a constraint", test_default_trait_is_not_a_constraint);
  run_test("client members stay optional", test_client_members_stay_optional);
  run_test("constraint policy table", test_constraint_policy_table);
  run_test("member constraint or target", test_member_constraint_or_target);
  run_test("transitively but not directly constrained", test_transitively_but_not_directly);
  run_test("symbol mapping", test_symbol_mapping);
  run_test("identifier helpers", test_identifier_helpers);

  std::cout << "\n[Protocols] constraints model matrix\n";
  run_test("constraints model for every protocol", test_constraints_model_for_every_protocol);
  run_test("replace protocol is idempotent", test_replace_protocol_is_idempotent);
  run_test("remove operations", test_remove_operations);
  run_test("remove shapes", test_remove_shapes);
  run_test("remove shapes cascades through collections", test_remove_shapes_cascades_through_collections);
  run_test("contains any shape id", test_contains_any_shape_id);

  std::cout << "\n[Loader] JSON AST models\n";
  run_test("prelude shapes", test_prelude_shapes);
  run_test("loader errors", test_loader_errors);
  run_test("loader shapes", test_loader_shapes);

  std::cout << "\n[Normalize] synthetic shapes\n";
  run_test("operation normalizer", test_operation_normalizer);
  run_test("event stream normalizer", test_event_stream_normalizer);

  std::cout << "\n[Support] settings, writer, events\n";
  run_test("settings merge", test_settings_merge);
  run_test("code writer", test_code_writer);
  run_test("harness event JSON", test_harness_event_json);
  run_test("JSON surrogate pairs", test_json_surrogate_pairs);
  run_test("config snapshot under re-init", test_config_snapshot_under_reinit);

  std::cout << "\n[Sandbox] processes and workspaces\n";
  run_test("shell command output and exit", test_shell_command_output_and_exit);
  run_test("process timeout and spawn failure", test_process_timeout_and_spawn_failure);
  run_test("workspace lifetime", test_workspace_lifetime);
  run_test("file manifest", test_file_manifest);
  run_test("test project layout", test_test_project_layout);

  std::cout << "\n[EventStream] generation harness\n";
  run_test("event stream test cases", test_event_stream_test_cases);
  run_test("client project contents", test_client_project_contents);
  run_test("server project contents", test_server_project_contents);
  run_test("backend rejects wrong target", test_backend_rejects_wrong_target);
  run_test("unnormalized model rejected", test_unnormalized_model_rejected);
  run_test("run every test case", test_run_every_test_case);
  run_test("run_test_case reports command failure", test_run_test_case_reports_command_failure);
  run_test("unsupported member target", test_unsupported_member_target);
  run_test("real build", test_real_build);

  std::cout << "\n[Integration] plugin driver\n";
  run_test("plugin context settings", test_plugin_context_settings);
  run_test("integration success", test_integration_success);
  run_test("integration custom command and dir", test_integration_custom_command_and_dir);
  run_test("integration failure", test_integration_failure);

  fs::remove_all(g_workspace_root);
  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << ", " << g_tests_skipped << " skipped";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
