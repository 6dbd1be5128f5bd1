#pragma once

// shapeforge/render.hpp: C++ renderings shared by the client and server
// backends. Backends decide fallibility and unknown-variant handling; the
// text shapes live here.
//
// Generated type layout (namespace <crate>::models):
//
//   struct TestStruct {
//     std::optional<std::int32_t> some_int;
//     class Builder;
//     static Builder builder();
//     bool operator==(const TestStruct&) const = default;
//   };
//
//   class TestUnion {             // one factory, is_ and as_ per variant
//     static TestUnion foo(std::string value);
//     bool is_foo() const;
//     const std::string& as_foo() const;
//     ...
//   };

#include <string>
#include <vector>

#include "shapeforge/event_stream_models.hpp"
#include "shapeforge/model.hpp"
#include "shapeforge/symbol.hpp"
#include "shapeforge/writer.hpp"

namespace shapeforge {

struct VariantCase {
  std::string name;  // factory/accessor stem, already a valid identifier
  std::string type;  // "std::monostate" for value-less cases
};

void render_structure(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& structure);

// "class S::Builder". A fallible builder checks that every non-optional member
// without a default was set and throws runtime::BuildError otherwise.
void render_builder(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& structure,
                    bool fallible);
// "inline S::Builder S::builder()"
void render_builder_accessor(CodeWriter& w, const SymbolResolver& resolver, const Shape& structure);

void render_variant_class(CodeWriter& w, const std::string& class_name, const std::vector<VariantCase>& cases);
void render_union(CodeWriter& w, const Model& model, const SymbolResolver& resolver, const Shape& union_shape,
                  bool render_unknown);

// Literal for a member's default trait, typed for `sym`.
std::string default_value_literal(const Shape& member, const Symbol& sym);

// Body of src/runtime.hpp: event message, headers, flat JSON/XML payloads,
// and the error types generated code throws.
std::string event_stream_runtime_source();

struct GeneratedCodec {
  std::string marshaller;    // "TestStreamMarshaller"
  std::string unmarshaller;  // "TestStreamUnmarshaller"
  std::string error_type;    // "errors::TestStreamError"
};

// Marshaller and unmarshaller for a normalized @streaming union. Client
// codecs map unrecognized events to the Unknown variant and unmodeled errors
// to the unhandled error case; server codecs throw runtime::UnmarshallError.
// Throws Error(unsupported_shape) for members the flat codec cannot carry.
GeneratedCodec render_event_stream_codec(CodeWriter& w, const Model& model, const SymbolResolver& resolver,
                                         const Shape& stream_union, PayloadFormat format,
                                         const std::string& content_type);

}  // namespace shapeforge
