#include <ontouml_validation/antipattern_validator.hpp>
#include <algorithm>
#include <unordered_set>

namespace ontouml_validation {

namespace {

using S = ClassStereotype;
using ontouml_model::Association;
using ontouml_model::Generalization;

// Types whose extensions may overlap unless a disjoint set separates them above.
bool is_overlapping_sortal(ClassStereotype s) {
    switch (s) {
    case S::Kind:
    case S::Subkind:
    case S::Phase:
    case S::Role:
    case S::Collective:
    case S::Quantity:
    case S::Relator:
    case S::Mode:
        return true;
    case S::Category:
    case S::PhaseMixin:
    case S::RoleMixin:
    case S::Mixin:
    case S::Quality:
        return false;
    }
    return false;
}

void flag(ValidationProblems& out, ElementId element, AntiPatternKind kind) {
    out.push_back(AntiPatternProblem{element, kind});
}

// Incident associations of `info` with the given stereotype.
template <typename F>
void for_each_association(const ClassifierGraph& graph, const ClassifierInfo& info,
    AssociationStereotype stereotype, F&& f)
{
    for (ElementId a_id : info.associations) {
        if (graph.association_stereotype(a_id) != stereotype) continue;
        if (const auto* a = graph.model().get<Association>(a_id)) f(a_id, *a);
    }
}

std::size_t count_associations(const ClassifierGraph& graph, const ClassifierInfo& info,
    AssociationStereotype stereotype)
{
    std::size_t n = 0;
    for_each_association(graph, info, stereotype, [&](ElementId, const Association&) { ++n; });
    return n;
}

std::size_t count_as_source(const ClassifierGraph& graph, const ClassifierInfo& info,
    AssociationStereotype stereotype)
{
    std::size_t n = 0;
    for_each_association(graph, info, stereotype, [&](ElementId, const Association& a) {
        if (a.source.classifier == info.id) ++n;
    });
    return n;
}

ElementId opposite_end(const Association& a, ElementId self) {
    return a.source.classifier == self ? a.target.classifier : a.source.classifier;
}

} // namespace

void detect_bin_over(const ClassifierGraph& graph, ValidationProblems& out) {
    const auto& model = graph.model();
    for (ElementId a_id : graph.associations()) {
        const auto* a = model.get<Association>(a_id);
        if (!a) continue;
        const ElementId s = a->source.classifier;
        const ElementId t = a->target.classifier;
        if (!model.is_classifier(s) || !model.is_classifier(t)) continue;
        if (s == t) {
            flag(out, a_id, AntiPatternKind::BinOver);
            continue;
        }
        if (!graph.info(s) || !graph.info(t)) continue;
        if (graph.is_subtype_of(s, t) || graph.is_subtype_of(t, s)) {
            flag(out, a_id, AntiPatternKind::BinOver);
            continue;
        }

        const auto ss = graph.stereotype_of(s);
        const auto ts = graph.stereotype_of(t);
        if (!ss || !ts) continue;
        bool overlapping = false;
        if (is_overlapping_sortal(*ss) && is_overlapping_sortal(*ts))
            overlapping = !graph.are_disjoint_upwards(s, t);
        else if (is_mixin_like(*ss) && is_mixin_like(*ts))
            overlapping = !(graph.are_disjoint_upwards(s, t) && graph.are_disjoint_downwards(s, t));
        if (overlapping) flag(out, a_id, AntiPatternKind::BinOver);
    }
}

void detect_dec_int(const ClassifierGraph& graph, ValidationProblems& out) {
    const auto& model = graph.model();
    for (ElementId c : graph.classes()) {
        const ClassifierInfo* info = graph.info(c);
        std::size_t axes = 0;
        for (ElementId g_id : info->generalizations_as_source) {
            const auto* g = model.get<Generalization>(g_id);
            if (!g) continue;
            if (g->set_is_disjoint) {
                axes += 1;
                continue;
            }
            axes += static_cast<std::size_t>(std::count_if(g->targets.begin(), g->targets.end(),
                [&](ElementId t) {
                    const ClassifierInfo* ti = graph.info(t);
                    return ti && !ti->is_abstract();
                }));
        }
        if (axes > 1) flag(out, c, AntiPatternKind::DecInt);
    }
}

void detect_dep_phase(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        const ClassifierInfo* info = graph.info(c);
        if (info->stereotype != S::Phase) continue;
        if (count_associations(graph, *info, AssociationStereotype::Mediation) >= 1)
            flag(out, c, AntiPatternKind::DepPhase);
    }
}

void detect_free_role(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        const ClassifierInfo* info = graph.info(c);
        if (info->stereotype != S::Role) continue;
        if (count_associations(graph, *info, AssociationStereotype::Mediation) == 0)
            flag(out, c, AntiPatternKind::FreeRole);
    }
}

void detect_gs_rig(const ClassifierGraph& graph, ValidationProblems& out) {
    const auto& model = graph.model();
    for (ElementId g_id : graph.generalizations()) {
        const auto* g = model.get<Generalization>(g_id);
        if (!g) continue;
        bool rigid = false;
        bool anti_rigid = false;
        for (ElementId s : g->sources) {
            const auto st = graph.stereotype_of(s);
            if (!st) continue;
            rigid = rigid || is_rigid(*st);
            anti_rigid = anti_rigid || is_anti_rigid(*st);
        }
        if (rigid && anti_rigid) flag(out, g_id, AntiPatternKind::GSRig);
    }
}

void detect_het_coll(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        const ClassifierInfo* info = graph.info(c);
        if (info->stereotype != S::Collective) continue;
        if (count_as_source(graph, *info, AssociationStereotype::MemberOf) > 1)
            flag(out, c, AntiPatternKind::HetColl);
    }
}

void detect_homo_func(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        if (count_as_source(graph, *graph.info(c), AssociationStereotype::ComponentOf) == 1)
            flag(out, c, AntiPatternKind::HomoFunc);
    }
}

void detect_mix_rig(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        const ClassifierInfo* info = graph.info(c);
        if (info->stereotype != S::Mixin) continue;
        bool rigid = false;
        bool anti_rigid = false;
        for (ElementId child : info->children) {
            const auto st = graph.stereotype_of(child);
            if (!st) continue;
            rigid = rigid || is_rigid(*st);
            anti_rigid = anti_rigid || is_anti_rigid(*st);
        }
        if (rigid != anti_rigid) flag(out, c, AntiPatternKind::MixRig);
    }
}

void detect_mult_dep(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        std::unordered_set<ElementId> relators;
        for_each_association(graph, *graph.info(c), AssociationStereotype::Mediation,
            [&](ElementId, const Association& a) {
                const ElementId other = opposite_end(a, c);
                if (other != c && graph.has_stereotype_in_lineage(other, S::Relator))
                    relators.insert(other);
            });
        if (relators.size() > 1) flag(out, c, AntiPatternKind::MultDep);
    }
}

void detect_rel_rig(const ClassifierGraph& graph, ValidationProblems& out) {
    for (ElementId c : graph.classes()) {
        if (!graph.has_stereotype_in_lineage(c, S::Relator)) continue;
        bool mediates_rigid = false;
        for_each_association(graph, *graph.info(c), AssociationStereotype::Mediation,
            [&](ElementId, const Association& a) {
                const ElementId other = opposite_end(a, c);
                const auto st = graph.stereotype_of(other);
                if (other != c && st && is_rigid(*st)) mediates_rigid = true;
            });
        if (mediates_rigid) flag(out, c, AntiPatternKind::RelRig);
    }
}

void detect_undef_formal(const ClassifierGraph& graph, ValidationProblems& out) {
    const auto& model = graph.model();
    for (ElementId a_id : graph.associations()) {
        if (graph.association_stereotype(a_id) != AssociationStereotype::Formal) continue;
        const auto* a = model.get<Association>(a_id);
        const auto lacks = [&](ElementId end) {
            return graph.info(end) && !graph.has_intrinsic_properties(end);
        };
        if (lacks(a->source.classifier) || lacks(a->target.classifier))
            flag(out, a_id, AntiPatternKind::UndefFormal);
    }
}

void detect_undef_phase(const ClassifierGraph& graph, ValidationProblems& out) {
    const auto& model = graph.model();
    for (ElementId c : graph.classes()) {
        const ClassifierInfo* info = graph.info(c);
        if (info->stereotype != S::Phase) continue;
        bool defined = false;
        for (ElementId g_id : info->generalizations_as_source) {
            const auto* g = model.get<Generalization>(g_id);
            if (!g) continue;
            for (ElementId t : g->targets)
                defined = defined || graph.has_intrinsic_properties(t);
        }
        if (!defined) flag(out, c, AntiPatternKind::UndefPhase);
    }
}

ValidationProblems validate_antipatterns(const ClassifierGraph& graph) {
    ValidationProblems out;
    detect_bin_over(graph, out);
    detect_dec_int(graph, out);
    detect_dep_phase(graph, out);
    detect_free_role(graph, out);
    detect_gs_rig(graph, out);
    detect_het_coll(graph, out);
    detect_homo_func(graph, out);
    detect_mix_rig(graph, out);
    detect_mult_dep(graph, out);
    detect_rel_rig(graph, out);
    detect_undef_formal(graph, out);
    detect_undef_phase(graph, out);
    return out;
}

} // namespace ontouml_validation
