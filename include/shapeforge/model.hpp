#pragma once

// shapeforge/model.hpp: the immutable shape graph.
//
// Model is an arena of shapes keyed by ShapeId. Iteration order is the id
// order, so every traversal and every rendering pass over a model is
// deterministic. A Model is never mutated after construction: transforms take
// a model and return a new one.
//
// CONCURRENCY NOTES:
//   All member functions are const and touch no shared mutable state. One
//   model may be read from any number of threads.

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "shapeforge/shape.hpp"

namespace shapeforge {

class Model {
 public:
  Model() = default;
  explicit Model(std::map<ShapeId, Shape> shapes) : shapes_(std::move(shapes)) {}

  const Shape* get_shape(const ShapeId& id) const;
  bool contains(const ShapeId& id) const { return shapes_.contains(id); }

  // Throws Error(shape_not_found).
  const Shape& expect_shape(const ShapeId& id) const;
  // Additionally throws Error(model_invalid) when the shape is of another kind.
  const Shape& expect_shape(const ShapeId& id, ShapeType type) const;
  // expect_shape(ShapeId::from(id))
  const Shape& lookup(const std::string& id) const;

  // Member shapes of a container, in member order.
  std::vector<const Shape*> members(const Shape& shape) const;
  // Target of a member shape. Throws Error(model_invalid) for non-members.
  const Shape& target_of(const Shape& member) const;

  std::vector<const Shape*> shapes_of_type(ShapeType type) const;

  // Outgoing relationship edges: container -> members, member -> target,
  // operation -> input/output/errors, service -> operations.
  std::vector<ShapeId> neighbors(const Shape& shape) const;

  const std::map<ShapeId, Shape>& shapes() const { return shapes_; }
  std::size_t size() const { return shapes_.size(); }

 private:
  std::map<ShapeId, Shape> shapes_;
};

// Returns a model where each given shape replaces (or adds) the shape with the
// same id. When a replaced container drops member ids, the orphaned member
// shapes are removed as well.
Model replace_shapes(const Model& model, const std::vector<Shape>& replacements);

// Returns a model without the given shapes, their member shapes, members that
// target them and any service/operation references to them. A list or map that
// loses its member, key or value is removed too, and so on until nothing else
// changes. Unknown ids are ignored here; callers that require existence check
// first.
Model without_shapes(const Model& model, const std::vector<ShapeId>& ids);

}  // namespace shapeforge
