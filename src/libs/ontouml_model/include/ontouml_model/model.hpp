#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace ontouml_model {

// Index into Model::elements. Edges between elements are stored as ids.
using ElementId = std::size_t;
inline constexpr ElementId invalid_element = static_cast<ElementId>(-1);

enum class Navigability { Unspecified, Navigable, NonNavigable };
enum class Aggregation { None, Shared, Composite };

struct Package {
    std::string uuid;
    std::string name;
    std::string comment;
    std::vector<ElementId> contained_elements;
};

struct Class {
    std::string uuid;
    std::string name;
    // Raw stereotype literal as entered in the editor; may be empty or unknown.
    std::string stereotype;
    bool is_abstract = false;
    std::string properties;
    std::string functions;
    std::string comment;
};

struct Instance {
    std::string uuid;
    std::string instance_name;
    std::string instance_type;
    std::string instance_slots;
    std::string comment;
};

struct Generalization {
    std::string uuid;
    std::vector<ElementId> sources;  // subtypes
    std::vector<ElementId> targets;  // supertypes
    std::string set_name;
    bool set_is_covering = false;
    bool set_is_disjoint = false;
    std::string comment;
};

struct AssociationEnd {
    ElementId classifier = invalid_element;  // Class or Instance
    std::string multiplicity;
    std::string role;
    std::string reading;
    Navigability navigability = Navigability::Unspecified;
    Aggregation aggregation = Aggregation::None;
};

struct Association {
    std::string uuid;
    std::string stereotype;
    AssociationEnd source;
    AssociationEnd target;
    std::string comment;
};

struct Dependency {
    std::string uuid;
    std::string stereotype;
    ElementId source = invalid_element;
    ElementId target = invalid_element;
    bool target_arrow_open = false;
    std::string comment;
};

struct Comment {
    std::string uuid;
    std::string text;
};

struct CommentLink {
    std::string uuid;
    ElementId source = invalid_element;  // Comment
    ElementId target = invalid_element;
};

using Element = std::variant<Package, Class, Instance, Generalization, Association,
    Dependency, Comment, CommentLink>;

struct Model {
    std::string name;
    std::vector<Element> elements;
    ElementId root = invalid_element;  // root Package

    bool contains(ElementId id) const { return id < elements.size(); }

    // Typed lookup; nullptr when the id is out of range or names another element kind.
    template <typename T>
    const T* get(ElementId id) const {
        if (!contains(id)) return nullptr;
        return std::get_if<T>(&elements[id]);
    }

    const Package* root_package() const { return get<Package>(root); }

    bool is_classifier(ElementId id) const {
        return get<Class>(id) != nullptr || get<Instance>(id) != nullptr;
    }

    // External uuid of any element, empty for an invalid id.
    const std::string& uuid_of(ElementId id) const;
    // Human-facing label: class/package name, instance name, otherwise the uuid.
    std::string label_of(ElementId id) const;
};

} // namespace ontouml_model
