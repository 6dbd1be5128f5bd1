#pragma once

// shapeforge/constraints.hpp: constraint classification and reachability.
//
// A shape is *directly constrained* when it carries a constraint trait that the
// active codegen target materializes as a validated type (see ConstraintPolicy),
// or, for structures, when one of its members is non-optional without a
// non-null default. A shape *can reach* a constrained shape when any path of
// relationship edges from it ends at a directly constrained shape.
//
// Every function here is pure. Results depend only on the model and the
// resolver, so concurrent calls over one immutable model are safe.

#include <vector>

#include "shapeforge/model.hpp"
#include "shapeforge/symbol.hpp"

namespace shapeforge {

// Constraint trait kinds attached to the shape itself.
std::vector<ConstraintKind> constraint_kinds(const Shape& shape);

// True when the policy materializes at least one of the shape's constraint
// traits for its kind. Ignores structure members and default traits.
bool has_materialized_constraint(const Shape& shape, const ConstraintPolicy& policy);

bool is_directly_constrained(const Shape& shape, const SymbolResolver& resolver);

// Iterative DFS with a visited set scoped to this call; cycles terminate.
// A member delegates to its target.
bool can_reach_constrained_shape(const Shape& shape, const Model& model, const SymbolResolver& resolver);

bool member_has_constraint_trait_or_target_has(const Shape& member, const Model& model,
                                               const SymbolResolver& resolver);

bool is_transitively_but_not_directly_constrained(const Shape& shape, const Model& model,
                                                  const SymbolResolver& resolver);

}  // namespace shapeforge
