#pragma once

// shapeforge/model_loader.hpp: builds a Model from the JSON AST form of the
// shape-definition language:
//
//   {"smithy": "2.0",
//    "shapes": {"test#MapA": {"type": "map",
//                             "key": {"target": "smithy.api#String"},
//                             "value": {"target": "test#MapB"},
//                             "traits": {"smithy.api#length": {"min": 1, "max": 69}}}}}
//
// The smithy.api prelude (String, Integer, PrimitiveBoolean, ...) is merged in.
// Traits outside the Trait variant are dropped with a debug log line. Member
// targets, service operations and operation input/output/errors must resolve,
// otherwise Error(model_invalid) is thrown. JSON syntax errors throw
// Error(json_parse_error).

#include <string>

#include "shapeforge/model.hpp"

namespace shapeforge {

Model load_model_json(const std::string& text);

// Throws Error(io_error) when the file cannot be read.
Model load_model_file(const std::string& path);

// The prelude on its own.
Model prelude_model();

}  // namespace shapeforge
