#include <ontouml_validation/stereotype.hpp>

namespace ontouml_validation {

namespace {

struct ClassLiteral {
    std::string_view literal;
    ClassStereotype stereotype;
};

struct AssociationLiteral {
    std::string_view literal;
    AssociationStereotype stereotype;
};

constexpr ClassLiteral class_literals[] = {
    {"kind", ClassStereotype::Kind},
    {"subkind", ClassStereotype::Subkind},
    {"phase", ClassStereotype::Phase},
    {"role", ClassStereotype::Role},
    {"collective", ClassStereotype::Collective},
    {"quantity", ClassStereotype::Quantity},
    {"relator", ClassStereotype::Relator},
    {"category", ClassStereotype::Category},
    {"phaseMixin", ClassStereotype::PhaseMixin},
    {"roleMixin", ClassStereotype::RoleMixin},
    {"mixin", ClassStereotype::Mixin},
    {"mode", ClassStereotype::Mode},
    {"quality", ClassStereotype::Quality},
};

constexpr AssociationLiteral association_literals[] = {
    {"", AssociationStereotype::None},
    {"formal", AssociationStereotype::Formal},
    {"mediation", AssociationStereotype::Mediation},
    {"characterization", AssociationStereotype::Characterization},
    {"structuration", AssociationStereotype::Structuration},
    {"componentOf", AssociationStereotype::ComponentOf},
    {"containment", AssociationStereotype::Containment},
    {"memberOf", AssociationStereotype::MemberOf},
    {"subcollectionOf", AssociationStereotype::SubcollectionOf},
    {"subquantityOf", AssociationStereotype::SubquantityOf},
};

} // namespace

std::optional<ClassStereotype> parse_class_stereotype(std::string_view literal) {
    for (const auto& l : class_literals)
        if (l.literal == literal) return l.stereotype;
    return std::nullopt;
}

std::optional<AssociationStereotype> parse_association_stereotype(std::string_view literal) {
    for (const auto& l : association_literals)
        if (l.literal == literal) return l.stereotype;
    return std::nullopt;
}

std::string_view to_string(ClassStereotype s) {
    switch (s) {
    case ClassStereotype::Kind: return "kind";
    case ClassStereotype::Subkind: return "subkind";
    case ClassStereotype::Phase: return "phase";
    case ClassStereotype::Role: return "role";
    case ClassStereotype::Collective: return "collective";
    case ClassStereotype::Quantity: return "quantity";
    case ClassStereotype::Relator: return "relator";
    case ClassStereotype::Category: return "category";
    case ClassStereotype::PhaseMixin: return "phaseMixin";
    case ClassStereotype::RoleMixin: return "roleMixin";
    case ClassStereotype::Mixin: return "mixin";
    case ClassStereotype::Mode: return "mode";
    case ClassStereotype::Quality: return "quality";
    }
    return "";
}

std::string_view to_string(AssociationStereotype s) {
    switch (s) {
    case AssociationStereotype::None: return "";
    case AssociationStereotype::Formal: return "formal";
    case AssociationStereotype::Mediation: return "mediation";
    case AssociationStereotype::Characterization: return "characterization";
    case AssociationStereotype::Structuration: return "structuration";
    case AssociationStereotype::ComponentOf: return "componentOf";
    case AssociationStereotype::Containment: return "containment";
    case AssociationStereotype::MemberOf: return "memberOf";
    case AssociationStereotype::SubcollectionOf: return "subcollectionOf";
    case AssociationStereotype::SubquantityOf: return "subquantityOf";
    }
    return "";
}

bool valid_subtyping(ClassStereotype child, ClassStereotype parent) {
    using S = ClassStereotype;
    switch (child) {
    case S::Kind:
    case S::Collective:
    case S::Quantity:
    case S::Relator:
    case S::Quality:
    case S::Mode:
    case S::Category:
    case S::Mixin:
        return parent == S::Category || parent == S::Mixin;
    case S::Subkind:
    case S::Phase:
    case S::Role:
        switch (parent) {
        case S::Kind:
        case S::Subkind:
        case S::Collective:
        case S::Quantity:
        case S::Relator:
        case S::Category:
        case S::Mixin:
        case S::Mode:
        case S::Quality:
            return true;
        case S::Phase:
        case S::PhaseMixin:
            return child == S::Phase;
        case S::Role:
        case S::RoleMixin:
            return child == S::Role;
        }
        return false;
    case S::PhaseMixin:
        return parent == S::Mixin || parent == S::PhaseMixin || parent == S::Category;
    case S::RoleMixin:
        return parent == S::Mixin || parent == S::RoleMixin || parent == S::Category
            || parent == S::PhaseMixin;
    }
    return false;
}

bool is_identity_provider(ClassStereotype s) {
    switch (s) {
    case ClassStereotype::Kind:
    case ClassStereotype::Collective:
    case ClassStereotype::Quantity:
    case ClassStereotype::Relator:
    case ClassStereotype::Quality:
    case ClassStereotype::Mode:
        return true;
    case ClassStereotype::Subkind:
    case ClassStereotype::Phase:
    case ClassStereotype::Role:
    case ClassStereotype::Category:
    case ClassStereotype::PhaseMixin:
    case ClassStereotype::RoleMixin:
    case ClassStereotype::Mixin:
        return false;
    }
    return false;
}

bool requires_identity(ClassStereotype s) {
    return !is_mixin_like(s);
}

bool is_rigid(ClassStereotype s) {
    switch (s) {
    case ClassStereotype::Kind:
    case ClassStereotype::Subkind:
    case ClassStereotype::Collective:
    case ClassStereotype::Quantity:
    case ClassStereotype::Relator:
    case ClassStereotype::Category:
    case ClassStereotype::Mode:
    case ClassStereotype::Quality:
        return true;
    case ClassStereotype::Phase:
    case ClassStereotype::Role:
    case ClassStereotype::PhaseMixin:
    case ClassStereotype::RoleMixin:
    case ClassStereotype::Mixin:
        return false;
    }
    return false;
}

bool is_anti_rigid(ClassStereotype s) {
    switch (s) {
    case ClassStereotype::Role:
    case ClassStereotype::Phase:
    case ClassStereotype::PhaseMixin:
    case ClassStereotype::RoleMixin:
        return true;
    case ClassStereotype::Kind:
    case ClassStereotype::Subkind:
    case ClassStereotype::Collective:
    case ClassStereotype::Quantity:
    case ClassStereotype::Relator:
    case ClassStereotype::Category:
    case ClassStereotype::Mode:
    case ClassStereotype::Quality:
    case ClassStereotype::Mixin:
        return false;
    }
    return false;
}

bool is_mixin_like(ClassStereotype s) {
    switch (s) {
    case ClassStereotype::Category:
    case ClassStereotype::Mixin:
    case ClassStereotype::PhaseMixin:
    case ClassStereotype::RoleMixin:
        return true;
    case ClassStereotype::Kind:
    case ClassStereotype::Subkind:
    case ClassStereotype::Phase:
    case ClassStereotype::Role:
    case ClassStereotype::Collective:
    case ClassStereotype::Quantity:
    case ClassStereotype::Relator:
    case ClassStereotype::Mode:
    case ClassStereotype::Quality:
        return false;
    }
    return false;
}

} // namespace ontouml_validation
