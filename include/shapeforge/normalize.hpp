#pragma once

// shapeforge/normalize.hpp: model rewrite passes run before generation.
//
// Both passes are value transforms. EventStreamNormalizer expects a model that
// OperationNormalizer has already processed:
//
//   Model m = EventStreamNormalizer::transform(OperationNormalizer::transform(raw));

#include <string>

#include "shapeforge/model.hpp"

namespace shapeforge {

// Gives every operation its own input and output structure in the
// "<ns>.synthetic" namespace ("<Op>Input", "<Op>Output"). Members and traits of
// the original structure are copied; operations without input or output get
// an empty one. Synthetic shapes carry SyntheticInputOutputTrait.
struct OperationNormalizer {
  static Model transform(const Model& model);

  static ShapeId synthetic_input_id(const ShapeId& operation);
  static ShapeId synthetic_output_id(const ShapeId& operation);
};

// Splits error members out of every @streaming union. The union keeps its
// event members and records the error members in
// SyntheticEventStreamUnionTrait. Operations whose input or output streams
// such a union gain those errors in their error list.
struct EventStreamNormalizer {
  static Model transform(const Model& model);
};

// The @streaming union bound to a structure member, if any.
const Shape* event_stream_union(const Model& model, const Shape& structure);

}  // namespace shapeforge
