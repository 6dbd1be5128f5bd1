#pragma once

// shapeforge/settings.hpp: composable codegen settings.
//
// AdditionalSettings wraps a settings tree. merge() is recursive, so two
// settings that both write under "codegen" keep each other's keys; only a
// scalar written by both takes the right-hand value.
//
//   auto s = AdditionalSettings::generate_codegen_comments()
//                .merge(AdditionalSettings::public_constrained_types(false));
//   // {"codegen": {"debugMode": true, "publicConstrainedTypes": false}}

#include <initializer_list>
#include <utility>

#include "shapeforge/jsonlite.hpp"

namespace shapeforge {

class AdditionalSettings {
 public:
  AdditionalSettings() = default;
  explicit AdditionalSettings(jsonlite::Object node) : node_(std::move(node)) {}

  // {"codegen": {"debugMode": <debug_mode>}}
  static AdditionalSettings generate_codegen_comments(bool debug_mode = true);
  // {"codegen": {"publicConstrainedTypes": <enabled>}}
  static AdditionalSettings public_constrained_types(bool enabled);

  static AdditionalSettings merge(std::initializer_list<AdditionalSettings> settings);
  AdditionalSettings merge(const AdditionalSettings& other) const;

  const jsonlite::Object& to_object() const { return node_; }
  bool empty() const { return node_.empty(); }

  bool operator==(const AdditionalSettings& other) const { return node_ == other.node_; }

 private:
  jsonlite::Object node_;
};

}  // namespace shapeforge
