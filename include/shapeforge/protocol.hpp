#pragma once

// shapeforge/protocol.hpp: model fixtures for running one analysis matrix
// against every supported protocol.
//
// A service carries at most one protocol trait. replace_protocol_trait removes
// every known protocol trait before adding the requested one, so applying it
// twice with the same protocol leaves exactly one trait.

#include <string>
#include <utility>
#include <vector>

#include "shapeforge/model.hpp"

namespace shapeforge {

inline constexpr const char* kConstraintsServiceId = "com.amazonaws.constraints#ConstraintsService";

const std::vector<Protocol>& all_protocols();

Model replace_protocol_trait(const Model& model, const ShapeId& service_id, Protocol protocol);

// Every id must exist: throws Error(shape_not_found) before changing anything.
Model remove_shapes(const Model& model, const std::vector<ShapeId>& ids);

// Throws Error(invariant_violation) when an operation is not bound to the
// service, or when the result would leave the service without operations or
// still bound to a removed id.
Model remove_operations(const Model& model, const ShapeId& service_id, const std::vector<ShapeId>& ops);

bool contains_any_shape_id(const std::vector<ShapeId>& list, const std::vector<ShapeId>& ids);

// Loads the constraints fixture at `path` and binds `protocol` to
// kConstraintsServiceId. Returns {service id, model}.
std::pair<ShapeId, Model> load_constraints_model(Protocol protocol, const std::string& path);

// Default location of models/constraints.json (SHAPEFORGE_MODELS_DIR at build
// time, overridable with the SHAPEFORGE_MODELS_DIR environment variable).
std::string default_constraints_model_path();

}  // namespace shapeforge
