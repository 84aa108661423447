#pragma once

#include <optional>
#include <string_view>

namespace ontouml_validation {

enum class ClassStereotype {
    // Sortals
    Kind,
    Subkind,
    Phase,
    Role,
    Collective,
    Quantity,
    Relator,
    // Nonsortals
    Category,
    PhaseMixin,
    RoleMixin,
    Mixin,
    // Aspects
    Mode,
    Quality,
};

enum class AssociationStereotype {
    None,  // plain association, empty literal
    Formal,
    Mediation,
    Characterization,
    Structuration,
    ComponentOf,
    Containment,
    MemberOf,
    SubcollectionOf,
    SubquantityOf,
};

// Both parsers accept any text; unknown literals (and "" for classes) give nullopt.
std::optional<ClassStereotype> parse_class_stereotype(std::string_view literal);
std::optional<AssociationStereotype> parse_association_stereotype(std::string_view literal);

std::string_view to_string(ClassStereotype s);
std::string_view to_string(AssociationStereotype s);

// Whether `child` may directly specialize `parent`.
bool valid_subtyping(ClassStereotype child, ClassStereotype parent);

bool is_identity_provider(ClassStereotype s);
bool requires_identity(ClassStereotype s);
bool is_rigid(ClassStereotype s);
bool is_anti_rigid(ClassStereotype s);
// category, mixin, phaseMixin, roleMixin
bool is_mixin_like(ClassStereotype s);

} // namespace ontouml_validation
