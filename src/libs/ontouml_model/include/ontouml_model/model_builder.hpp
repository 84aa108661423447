#pragma once

#include <ontouml_model/model.hpp>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace ontouml_model {

// Appends elements to a Model arena. Every add_* call places the new element into
// `package` (the root package by default) and returns its id.
class ModelBuilder {
public:
    explicit ModelBuilder(std::string model_name = {}, std::string root_uuid = "root");

    ElementId root() const { return model_.root; }

    ElementId add_package(std::string uuid, std::string name, ElementId package = invalid_element);
    ElementId add_class(std::string uuid, std::string name, std::string stereotype,
        bool is_abstract = false, std::string properties = {}, ElementId package = invalid_element);
    ElementId add_instance(std::string uuid, std::string name, std::string type,
        ElementId package = invalid_element);
    ElementId add_generalization(std::string uuid,
        std::vector<ElementId> sources,
        std::vector<ElementId> targets,
        bool is_disjoint = false,
        bool is_covering = false,
        ElementId package = invalid_element);
    ElementId add_association(std::string uuid, std::string stereotype,
        ElementId source, std::string source_multiplicity,
        ElementId target, std::string target_multiplicity,
        ElementId package = invalid_element);
    ElementId add_association(Association association, ElementId package = invalid_element);
    ElementId add_dependency(std::string uuid, ElementId source, ElementId target,
        ElementId package = invalid_element);
    ElementId add_comment(std::string uuid, std::string text, ElementId package = invalid_element);
    ElementId add_comment_link(std::string uuid, ElementId comment, ElementId target,
        ElementId package = invalid_element);

    // Element placed without a container; used by loaders that resolve containment later.
    ElementId add_detached(Element element);
    // Adds an existing element id to a package's contained list.
    void place(ElementId element, ElementId package);

    Element& at(ElementId id) { return model_.elements.at(id); }
    const Model& model() const { return model_; }
    void set_name(std::string name) { model_.name = std::move(name); }
    Model build() { return std::move(model_); }

private:
    ElementId append(Element element, ElementId package);

    Model model_;
};

} // namespace ontouml_model
