#pragma once

#include <ontouml_model/model.hpp>
#include <ontouml_validation/stereotype.hpp>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ontouml_validation {

using ontouml_model::ElementId;
using ontouml_model::Model;

namespace detail {

template <typename Visitor>
void walk_package(const Model& model, ElementId package_id, Visitor& visit,
    std::unordered_set<ElementId>& seen)
{
    const auto* package = model.get<ontouml_model::Package>(package_id);
    if (!package) return;
    for (ElementId id : package->contained_elements) {
        if (!model.contains(id) || !seen.insert(id).second) continue;
        visit(id, model.elements[id]);
        if (model.get<ontouml_model::Package>(id))
            walk_package(model, id, visit, seen);
    }
}

} // namespace detail

// Depth-first over the package tree in containment order. Packages are visited before
// their content. Each element is visited at most once, so shared or cyclic containment
// cannot loop.
template <typename Visitor>
void for_each_element(const Model& model, Visitor&& visit) {
    std::unordered_set<ElementId> seen{model.root};
    detail::walk_package(model, model.root, visit, seen);
}

struct ClassifierInfo {
    ElementId id = ontouml_model::invalid_element;
    const ontouml_model::Class* cls = nullptr;
    std::optional<ClassStereotype> stereotype;
    std::vector<ElementId> parents;   // direct supertypes
    std::vector<ElementId> children;  // direct subtypes
    std::vector<ElementId> generalizations_as_source;
    std::vector<ElementId> generalizations_as_target;
    std::vector<ElementId> associations;  // incident, each listed once
    bool characterized = false;            // target of some characterization
    bool bears_characterization = false;   // source of some characterization

    bool is_abstract() const { return cls && cls->is_abstract; }
};

// Aggregate view of the classes in a model, collected in one pass over the package tree.
// All closure queries guard against generalization cycles and visit each class at most
// once per query.
class ClassifierGraph {
public:
    explicit ClassifierGraph(const Model& model);

    const Model& model() const { return model_; }

    // Traversal-ordered element lists.
    const std::vector<ElementId>& classes() const { return classes_; }
    const std::vector<ElementId>& generalizations() const { return generalizations_; }
    const std::vector<ElementId>& associations() const { return associations_; }

    // nullptr unless `id` is a Class reached by the traversal.
    const ClassifierInfo* info(ElementId id) const;
    std::optional<ClassStereotype> stereotype_of(ElementId id) const;
    std::optional<AssociationStereotype> association_stereotype(ElementId association) const;

    // One or more generalization edges lead from `a` up to `b`.
    bool is_subtype_of(ElementId a, ElementId b) const;
    bool is_same_or_subtype_of(ElementId a, ElementId b) const;

    // Nearest of `a` and its ancestors that is `b` or one of b's ancestors.
    std::optional<ElementId> least_upper_bound(ElementId a, ElementId b) const;
    // Nearest of `b` and its descendants that is `a` or one of a's descendants.
    std::optional<ElementId> greatest_lower_bound(ElementId a, ElementId b) const;

    bool are_disjoint_upwards(ElementId a, ElementId b) const;
    bool are_disjoint_downwards(ElementId a, ElementId b) const;

    // `id` or one of its ancestors satisfies `pred`.
    bool any_in_lineage(ElementId id, const std::function<bool(const ClassifierInfo&)>& pred) const;
    bool has_stereotype_in_lineage(ElementId id, ClassStereotype stereotype) const;
    // Own non-blank property text or a characterization, directly or through ancestry.
    bool has_intrinsic_properties(ElementId id) const;

private:
    void collect_class(ElementId id, const ontouml_model::Class& cls);
    void collect_generalization(ElementId id, const ontouml_model::Generalization& g);
    void collect_association(ElementId id, const ontouml_model::Association& a);

    bool reaches_ancestor(ElementId from, ElementId ancestor,
        std::unordered_set<ElementId>& on_path, std::unordered_set<ElementId>& exhausted) const;
    bool lineage_matches(ElementId id, const std::function<bool(const ClassifierInfo&)>& pred,
        std::unordered_set<ElementId>& on_path, std::unordered_set<ElementId>& exhausted) const;
    ClassifierInfo* mutable_info(ElementId id);

    const Model& model_;
    std::unordered_map<ElementId, ClassifierInfo> infos_;
    std::vector<ElementId> classes_;
    std::vector<ElementId> generalizations_;
    std::vector<ElementId> associations_;
};

} // namespace ontouml_validation
