#include "shapeforge/constraints.hpp"

#include <set>
#include <utility>

#include "shapeforge/log.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

std::vector<ConstraintKind> constraint_kinds(const Shape& shape) {
  std::vector<ConstraintKind> out;
  if (shape.has_trait<LengthTrait>()) out.push_back(ConstraintKind::length);
  if (shape.has_trait<RangeTrait>()) out.push_back(ConstraintKind::range);
  if (shape.has_trait<PatternTrait>()) out.push_back(ConstraintKind::pattern);
  if (shape.has_trait<UniqueItemsTrait>()) out.push_back(ConstraintKind::unique_items);
  if (shape.has_trait<EnumTrait>()) out.push_back(ConstraintKind::enum_values);
  return out;
}

bool has_materialized_constraint(const Shape& shape, const ConstraintPolicy& policy) {
  if (shape.is_member()) return false;
  for (ConstraintKind kind : constraint_kinds(shape)) {
    if (policy.materializes(shape.type, kind)) return true;
  }
  return false;
}

bool is_directly_constrained(const Shape& shape, const SymbolResolver& resolver) {
  if (shape.has_trait<DefaultTrait>()) return false;

  switch (shape.type) {
    case ShapeType::member:
      return false;
    case ShapeType::structure:
      // A structure with a member that must be set cannot be default
      // constructed, so its builder has to validate.
      for (const Shape* m : resolver.model().members(shape)) {
        if (!resolver.to_symbol(*m).optional && !has_non_null_default(*m)) return true;
      }
      return false;
    default:
      return has_materialized_constraint(shape, resolver.constraint_policy());
  }
}

bool can_reach_constrained_shape(const Shape& shape, const Model& model, const SymbolResolver& resolver) {
  if (shape.is_member()) return can_reach_constrained_shape(model.target_of(shape), model, resolver);

  std::set<ShapeId> visited;
  std::vector<ShapeId> stack{shape.id};
  while (!stack.empty()) {
    const ShapeId id = std::move(stack.back());
    stack.pop_back();
    if (!visited.insert(id).second) continue;

    const Shape& current = model.expect_shape(id);
    if (is_directly_constrained(current, resolver)) {
      log_debug("constraints", shape.id.to_string() + " reaches " + id.to_string());
      return true;
    }
    for (auto& next : model.neighbors(current)) {
      if (!visited.contains(next)) stack.push_back(std::move(next));
    }
  }
  return false;
}

bool member_has_constraint_trait_or_target_has(const Shape& member, const Model& model,
                                               const SymbolResolver& resolver) {
  if (!member.is_member()) {
    throw Error(ErrorCode::model_invalid, member.id.to_string() + " is not a member");
  }
  return !constraint_kinds(member).empty() || is_directly_constrained(model.target_of(member), resolver);
}

bool is_transitively_but_not_directly_constrained(const Shape& shape, const Model& model,
                                                  const SymbolResolver& resolver) {
  return !is_directly_constrained(shape, resolver) && can_reach_constrained_shape(shape, model, resolver);
}

}  // namespace shapeforge
