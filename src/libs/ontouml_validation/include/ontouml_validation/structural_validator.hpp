#pragma once

#include <ontouml_validation/graph_walker.hpp>
#include <ontouml_validation/multiplicity.hpp>
#include <ontouml_validation/problem.hpp>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace ontouml_validation {

// Accumulated number of identity providers a class may inherit: [min, max].
struct IdentityInterval {
    std::size_t min = 0;
    std::size_t max = 0;

    bool is_exactly_one() const { return min == 1 && max == 1; }
};

// Well-formedness checks: stereotypes, subtyping legality, relation shapes, identity,
// and the role/relator/phase/mixin/aspect rules.
class StructuralValidator {
public:
    explicit StructuralValidator(const ClassifierGraph& graph);

    ValidationProblems run();

    // Available after run(); nullptr for elements that are not classes.
    const IdentityInterval* identity_interval(ElementId cls) const;
    // Sum of the opposite-end mediation lower bounds through ancestry, saturating at the
    // largest uint64_t.
    std::uint64_t mediated_lower_bound(ElementId cls) const;

private:
    struct ClassRecord {
        IdentityInterval identity;
        std::uint64_t opposing_mediation_lower = 0;
    };

    void check_class(ElementId id, const ontouml_model::Class& cls);
    void check_generalization(ElementId id, const ontouml_model::Generalization& g);
    void check_association(ElementId id, const ontouml_model::Association& a);
    void check_relation_rules(ElementId id, AssociationStereotype stereotype,
        const ontouml_model::Association& a,
        const std::optional<Multiplicity>& source,
        const std::optional<Multiplicity>& target);
    void check_aggregates();

    struct MediationWalk {
        std::unordered_set<ElementId> on_path;
        std::unordered_map<ElementId, std::uint64_t> memo;
        bool cut = false;  // reached a node already on the path
    };

    std::uint64_t mediated_lower_bound(ElementId cls, MediationWalk& walk) const;
    void error(ElementId element, ErrorKind kind, std::string message);

    const ClassifierGraph& graph_;
    std::unordered_map<ElementId, ClassRecord> records_;
    ValidationProblems problems_;
};

// Runs the structural pass over an already collected graph.
ValidationProblems validate_structure(const ClassifierGraph& graph);

} // namespace ontouml_validation
