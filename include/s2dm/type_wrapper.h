#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/type_wrapper.h — Type-wrapper pattern classifier
// ═══════════════════════════════════════════════════════════════════
//
//  Reduces a field's list/non-null nesting to one of six shape tags:
//
//    Type        bare                  [Type]    list
//    Type!       nonNull               [Type!]   listOfNonNull
//                                      [Type]!   nonNullList
//                                      [Type!]!  nonNullListOfNonNull
//
//  Only single-level lists are recognized; anything else raises
//  MaterializeError{UnsupportedShape}.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "schema.h"
#include <string>
#include <string_view>

namespace s2dm {

enum class TypeWrapperShape {
    Bare,
    NonNull,
    List,
    ListOfNonNull,
    NonNullList,
    NonNullListOfNonNull
};

// ── Local name of the shape in the s2dm vocabulary ──
const char* shapeTag(TypeWrapperShape shape);

struct WrapperClassification {
    TypeWrapperShape shape;
    std::string baseType;
};

// Classify a raw signature. `path` names the element in error messages.
WrapperClassification classifyTypeRef(const TypeRef& type, std::string_view path = {});

// Classify a field, honoring @noDuplicates: a set maps onto its list shape
// and is only valid on `[T]` and `[T!]`.
WrapperClassification classifyField(const FieldDefinition& field);

} // namespace s2dm
