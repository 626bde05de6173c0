// ═══════════════════════════════════════════════════════════════════
//  src/type_wrapper.cpp — Type-wrapper pattern classifier
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/type_wrapper.h"

namespace s2dm {

const char* shapeTag(TypeWrapperShape shape) {
    switch (shape) {
        case TypeWrapperShape::Bare:                 return "bare";
        case TypeWrapperShape::NonNull:              return "nonNull";
        case TypeWrapperShape::List:                 return "list";
        case TypeWrapperShape::ListOfNonNull:        return "listOfNonNull";
        case TypeWrapperShape::NonNullList:          return "nonNullList";
        case TypeWrapperShape::NonNullListOfNonNull: return "nonNullListOfNonNull";
    }
    return "bare";
}

WrapperClassification classifyTypeRef(const TypeRef& type, std::string_view path) {
    const auto& mods = type.modifiers;
    std::size_t i = 0;
    bool innerNonNull = false;
    bool isList = false;
    bool outerNonNull = false;

    // innermost element, then one list, then an optional outer non-null
    if (i < mods.size() && mods[i] == TypeModifier::NonNull) {
        innerNonNull = true;
        ++i;
    }
    if (i < mods.size() && mods[i] == TypeModifier::List) {
        isList = true;
        ++i;
        if (i < mods.size() && mods[i] == TypeModifier::NonNull) {
            outerNonNull = true;
            ++i;
        }
    }

    if (i != mods.size() || type.name.empty()) {
        std::string where = path.empty() ? type.toString() : std::string(path);
        throw MaterializeError(ErrorKind::UnsupportedShape, where,
            "signature '" + type.toString() + "' is not one of the six type-wrapper patterns");
    }

    TypeWrapperShape shape;
    if (!isList) {
        shape = innerNonNull ? TypeWrapperShape::NonNull : TypeWrapperShape::Bare;
    } else if (innerNonNull && outerNonNull) {
        shape = TypeWrapperShape::NonNullListOfNonNull;
    } else if (innerNonNull) {
        shape = TypeWrapperShape::ListOfNonNull;
    } else if (outerNonNull) {
        shape = TypeWrapperShape::NonNullList;
    } else {
        shape = TypeWrapperShape::List;
    }

    return {shape, type.name};
}

WrapperClassification classifyField(const FieldDefinition& field) {
    auto path = field.qualifiedName();
    auto result = classifyTypeRef(field.type, path);

    if (field.hasDirective("noDuplicates") &&
        result.shape != TypeWrapperShape::List &&
        result.shape != TypeWrapperShape::ListOfNonNull) {
        throw MaterializeError(ErrorKind::UnsupportedShape, path,
            "@noDuplicates requires '[T]' or '[T!]', got '" + field.type.toString() + "'");
    }
    return result;
}

} // namespace s2dm
