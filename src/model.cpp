#include "shapeforge/model.hpp"

#include <algorithm>
#include <set>

#include "shapeforge/types.hpp"

namespace shapeforge {

const Shape* Model::get_shape(const ShapeId& id) const {
  auto it = shapes_.find(id);
  return it == shapes_.end() ? nullptr : &it->second;
}

const Shape& Model::expect_shape(const ShapeId& id) const {
  const Shape* s = get_shape(id);
  if (!s) throw Error(ErrorCode::shape_not_found, id.to_string());
  return *s;
}

const Shape& Model::expect_shape(const ShapeId& id, ShapeType type) const {
  const Shape& s = expect_shape(id);
  if (s.type != type) {
    throw Error(ErrorCode::model_invalid, id.to_string() + " is a " + to_string(s.type) +
                                              ", expected " + to_string(type));
  }
  return s;
}

const Shape& Model::lookup(const std::string& id) const {
  return expect_shape(ShapeId::from(id));
}

std::vector<const Shape*> Model::members(const Shape& shape) const {
  std::vector<const Shape*> out;
  out.reserve(shape.member_ids.size());
  for (const auto& id : shape.member_ids) out.push_back(&expect_shape(id));
  return out;
}

const Shape& Model::target_of(const Shape& member) const {
  if (!member.is_member() || !member.target) {
    throw Error(ErrorCode::model_invalid, member.id.to_string() + " is not a member");
  }
  return expect_shape(*member.target);
}

std::vector<const Shape*> Model::shapes_of_type(ShapeType type) const {
  std::vector<const Shape*> out;
  for (const auto& [id, shape] : shapes_) {
    if (shape.type == type) out.push_back(&shape);
  }
  return out;
}

std::vector<ShapeId> Model::neighbors(const Shape& shape) const {
  std::vector<ShapeId> out;
  switch (shape.type) {
    case ShapeType::member:
      if (shape.target) out.push_back(*shape.target);
      break;
    case ShapeType::operation:
      if (shape.input) out.push_back(*shape.input);
      if (shape.output) out.push_back(*shape.output);
      out.insert(out.end(), shape.errors.begin(), shape.errors.end());
      break;
    case ShapeType::service:
      out = shape.operations;
      break;
    default:
      out = shape.member_ids;
      break;
  }
  return out;
}

Model replace_shapes(const Model& model, const std::vector<Shape>& replacements) {
  std::map<ShapeId, Shape> shapes = model.shapes();
  for (const auto& replacement : replacements) {
    auto it = shapes.find(replacement.id);
    if (it != shapes.end()) {
      for (const auto& old_member : it->second.member_ids) {
        const bool kept = std::find(replacement.member_ids.begin(), replacement.member_ids.end(),
                                    old_member) != replacement.member_ids.end();
        if (!kept) shapes.erase(old_member);
      }
    }
    shapes[replacement.id] = replacement;
  }
  return Model(std::move(shapes));
}

Model without_shapes(const Model& model, const std::vector<ShapeId>& ids) {
  std::map<ShapeId, Shape> shapes = model.shapes();
  std::set<ShapeId> removed;
  std::vector<ShapeId> pending(ids.begin(), ids.end());
  while (!pending.empty()) {
    const ShapeId id = pending.back();
    pending.pop_back();
    auto it = shapes.find(id);
    if (it == shapes.end()) continue;
    const Shape gone = std::move(it->second);
    shapes.erase(it);
    removed.insert(id);

    pending.insert(pending.end(), gone.member_ids.begin(), gone.member_ids.end());
    for (const auto& [other_id, other] : shapes) {
      // Members pointing at a removed shape go with it.
      if (other.is_member() && other.target == id) pending.push_back(other_id);
    }
    if (gone.is_member()) {
      // A list or map cannot exist without its member, key or value.
      auto container = shapes.find(id.without_member());
      if (container != shapes.end() &&
          (container->second.type == ShapeType::list || container->second.type == ShapeType::map)) {
        pending.push_back(container->first);
      }
    }
  }

  const auto is_removed = [&](const ShapeId& id) { return removed.contains(id); };
  for (auto& [id, shape] : shapes) {
    std::erase_if(shape.member_ids, is_removed);
    std::erase_if(shape.operations, is_removed);
    std::erase_if(shape.errors, is_removed);
    if (shape.input && is_removed(*shape.input)) shape.input.reset();
    if (shape.output && is_removed(*shape.output)) shape.output.reset();
  }
  return Model(std::move(shapes));
}

}  // namespace shapeforge
