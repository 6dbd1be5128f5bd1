#include "shapeforge/normalize.hpp"

#include <algorithm>
#include <vector>

#include "shapeforge/log.hpp"

namespace shapeforge {

namespace {

ShapeId synthetic_id(const ShapeId& operation, const char* suffix) {
  return ShapeId{operation.ns + ".synthetic", operation.name + suffix, {}};
}

// Copies `original` (or nothing) into a structure at `id`, members included.
void build_synthetic(std::vector<Shape>& out, const Model& model, const ShapeId& id,
                     const ShapeId& operation, const std::optional<ShapeId>& original) {
  Shape synthetic;
  synthetic.id = id;
  synthetic.type = ShapeType::structure;

  if (original) {
    const Shape& source = model.expect_shape(*original, ShapeType::structure);
    synthetic.traits = source.traits;
    synthetic.remove_trait<SyntheticInputOutputTrait>();
    for (const Shape* m : model.members(source)) {
      Shape member = *m;
      member.id = id.with_member(m->member_name());
      synthetic.member_ids.push_back(member.id);
      out.push_back(std::move(member));
    }
  }
  synthetic.traits.push_back(SyntheticInputOutputTrait{operation, original});
  out.push_back(std::move(synthetic));
}

}  // namespace

ShapeId OperationNormalizer::synthetic_input_id(const ShapeId& operation) {
  return synthetic_id(operation, "Input");
}

ShapeId OperationNormalizer::synthetic_output_id(const ShapeId& operation) {
  return synthetic_id(operation, "Output");
}

Model OperationNormalizer::transform(const Model& model) {
  std::vector<Shape> replacements;
  size_t normalized = 0;
  for (const Shape* op : model.shapes_of_type(ShapeType::operation)) {
    const ShapeId input = synthetic_input_id(op->id);
    const ShapeId output = synthetic_output_id(op->id);
    if (op->input == input && op->output == output) continue;
    Shape rewritten = *op;
    build_synthetic(replacements, model, input, op->id, op->input);
    build_synthetic(replacements, model, output, op->id, op->output);
    rewritten.input = input;
    rewritten.output = output;
    replacements.push_back(std::move(rewritten));
    ++normalized;
  }
  log_debug("normalize", "synthesized input/output for " + std::to_string(normalized) + " operations");
  return replace_shapes(model, replacements);
}

const Shape* event_stream_union(const Model& model, const Shape& structure) {
  for (const Shape* m : model.members(structure)) {
    const Shape& target = model.target_of(*m);
    if (target.type == ShapeType::union_ && target.has_trait<StreamingTrait>()) return &target;
  }
  return nullptr;
}

Model EventStreamNormalizer::transform(const Model& model) {
  std::vector<Shape> replacements;
  std::map<ShapeId, std::vector<ShapeId>> stream_errors;

  for (const Shape* u : model.shapes_of_type(ShapeType::union_)) {
    if (!u->has_trait<StreamingTrait>() || u->has_trait<SyntheticEventStreamUnionTrait>()) continue;
    Shape rewritten = *u;
    SyntheticEventStreamUnionTrait marker;
    rewritten.member_ids.clear();
    for (const Shape* m : model.members(*u)) {
      const Shape& target = model.target_of(*m);
      if (target.has_trait<ErrorTrait>()) {
        marker.error_members.push_back(EventStreamErrorMember{m->member_name(), target.id});
        stream_errors[u->id].push_back(target.id);
      } else {
        rewritten.member_ids.push_back(m->id);
      }
    }
    rewritten.traits.push_back(std::move(marker));
    replacements.push_back(std::move(rewritten));
  }

  for (const Shape* op : model.shapes_of_type(ShapeType::operation)) {
    Shape rewritten = *op;
    bool changed = false;
    for (const auto& io : {op->input, op->output}) {
      if (!io) continue;
      const Shape* stream = event_stream_union(model, model.expect_shape(*io));
      if (!stream) continue;
      for (const auto& err : stream_errors[stream->id]) {
        if (std::find(rewritten.errors.begin(), rewritten.errors.end(), err) == rewritten.errors.end()) {
          rewritten.errors.push_back(err);
          changed = true;
        }
      }
    }
    if (changed) replacements.push_back(std::move(rewritten));
  }
  return replace_shapes(model, replacements);
}

}  // namespace shapeforge
