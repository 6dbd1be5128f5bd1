#include "shapeforge/protocol.hpp"

#include <algorithm>
#include <cstdlib>

#include "shapeforge/log.hpp"
#include "shapeforge/model_loader.hpp"
#include "shapeforge/types.hpp"

#ifndef SHAPEFORGE_MODELS_DIR
#define SHAPEFORGE_MODELS_DIR "models"
#endif

namespace shapeforge {

const std::vector<Protocol>& all_protocols() {
  static const std::vector<Protocol> protocols = {Protocol::aws_json_1_0, Protocol::aws_json_1_1,
                                                  Protocol::rest_json_1, Protocol::rest_xml,
                                                  Protocol::rpcv2_cbor};
  return protocols;
}

Model replace_protocol_trait(const Model& model, const ShapeId& service_id, Protocol protocol) {
  Shape service = model.expect_shape(service_id, ShapeType::service);
  service.remove_trait<ProtocolTrait>();
  service.traits.push_back(ProtocolTrait{protocol});
  return replace_shapes(model, {service});
}

Model remove_shapes(const Model& model, const std::vector<ShapeId>& ids) {
  for (const auto& id : ids) (void)model.expect_shape(id);
  return without_shapes(model, ids);
}

Model remove_operations(const Model& model, const ShapeId& service_id, const std::vector<ShapeId>& ops) {
  Shape service = model.expect_shape(service_id, ShapeType::service);
  for (const auto& op : ops) {
    if (std::find(service.operations.begin(), service.operations.end(), op) == service.operations.end()) {
      throw Error(ErrorCode::invariant_violation,
                  op.to_string() + " is not an operation of " + service_id.to_string());
    }
  }
  std::erase_if(service.operations, [&](const ShapeId& id) {
    return std::find(ops.begin(), ops.end(), id) != ops.end();
  });
  Model changed = replace_shapes(model, {service});

  const Shape& after = changed.expect_shape(service_id, ShapeType::service);
  if (after.operations.empty()) {
    throw Error(ErrorCode::invariant_violation, service_id.to_string() + " would have no operations left");
  }
  if (contains_any_shape_id(after.operations, ops)) {
    throw Error(ErrorCode::invariant_violation, service_id.to_string() + " still binds a removed operation");
  }
  return changed;
}

bool contains_any_shape_id(const std::vector<ShapeId>& list, const std::vector<ShapeId>& ids) {
  return std::any_of(ids.begin(), ids.end(), [&](const ShapeId& id) {
    return std::find(list.begin(), list.end(), id) != list.end();
  });
}

std::pair<ShapeId, Model> load_constraints_model(Protocol protocol, const std::string& path) {
  const ShapeId service_id = ShapeId::from(kConstraintsServiceId);
  Model model = replace_protocol_trait(load_model_file(path), service_id, protocol);
  log_debug("protocol", "loaded " + path + " with " + protocol_trait_id(protocol));
  return {service_id, std::move(model)};
}

std::string default_constraints_model_path() {
  const char* dir = std::getenv("SHAPEFORGE_MODELS_DIR");
  return std::string(dir && *dir ? dir : SHAPEFORGE_MODELS_DIR) + "/constraints.json";
}

}  // namespace shapeforge
