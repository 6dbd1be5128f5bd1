#include "shapeforge/settings.hpp"

#include <utility>

namespace shapeforge {

namespace {

AdditionalSettings codegen_flag(const char* key, bool value) {
  jsonlite::Object codegen;
  codegen[key] = jsonlite::Value{value};
  jsonlite::Object root;
  root["codegen"] = jsonlite::Value{std::move(codegen)};
  return AdditionalSettings(std::move(root));
}

}  // namespace

AdditionalSettings AdditionalSettings::generate_codegen_comments(bool debug_mode) {
  return codegen_flag("debugMode", debug_mode);
}

AdditionalSettings AdditionalSettings::public_constrained_types(bool enabled) {
  return codegen_flag("publicConstrainedTypes", enabled);
}

AdditionalSettings AdditionalSettings::merge(std::initializer_list<AdditionalSettings> settings) {
  jsonlite::Object acc;
  for (const auto& s : settings) acc = jsonlite::merge(acc, s.node_);
  return AdditionalSettings(std::move(acc));
}

AdditionalSettings AdditionalSettings::merge(const AdditionalSettings& other) const {
  return AdditionalSettings(jsonlite::merge(node_, other.node_));
}

}  // namespace shapeforge
