#include <ontouml_validation/structural_validator.hpp>
#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace ontouml_validation {

namespace {

using S = ClassStereotype;

struct EndShape {
    std::uint64_t min_lower = 0;
    bool exactly_one = false;

    bool accepts(const Multiplicity& m) const {
        if (exactly_one) return m.is_exactly_one();
        return m.lower >= min_lower;
    }
    bool constrained() const { return exactly_one || min_lower > 0; }
};

struct RelationRule {
    EndShape source;
    EndShape target;
    std::vector<ClassStereotype> source_types;  // empty = unconstrained
    std::vector<ClassStereotype> target_types;
};

const std::vector<ClassStereotype> functional_complex_types = {
    S::Kind, S::Subkind, S::Phase, S::Role, S::Category, S::Mixin, S::PhaseMixin, S::RoleMixin,
};

const std::vector<ClassStereotype> member_types = {
    S::Kind, S::Subkind, S::Phase, S::Role, S::Collective,
    S::Category, S::Mixin, S::PhaseMixin, S::RoleMixin,
};

// Part-whole relations run from the whole (source) to the part (target).
RelationRule relation_rule(AssociationStereotype stereotype) {
    const EndShape any;
    const EndShape at_least_one{1, false};
    const EndShape exactly_one{1, true};
    switch (stereotype) {
    case AssociationStereotype::None:
    case AssociationStereotype::Formal:
        return {any, any, {}, {}};
    case AssociationStereotype::Mediation:
        return {at_least_one, at_least_one, {}, {}};
    case AssociationStereotype::Characterization:
        return {exactly_one, at_least_one, {}, {S::Quality, S::Mode}};
    case AssociationStereotype::Structuration:
        return {any, exactly_one, {S::Quality}, {S::Quality, S::Mode}};
    case AssociationStereotype::ComponentOf:
        return {any, at_least_one, functional_complex_types, functional_complex_types};
    case AssociationStereotype::MemberOf:
        return {any, at_least_one, {S::Collective}, member_types};
    case AssociationStereotype::SubcollectionOf:
        return {any, exactly_one, {S::Collective}, {S::Collective}};
    case AssociationStereotype::Containment:
        return {any, at_least_one, {S::Kind, S::Subkind, S::Phase, S::Role}, {S::Quantity}};
    case AssociationStereotype::SubquantityOf:
        return {exactly_one, exactly_one, {S::Quantity}, {S::Quantity}};
    }
    return {any, any, {}, {}};
}

std::string guillemets(std::string_view s) {
    return "«" + std::string(s) + "»";
}

std::string describe_shape(const EndShape& shape) {
    if (shape.exactly_one) return "exactly 1..1";
    return "a lower bound of at least " + std::to_string(shape.min_lower);
}

std::string describe_types(const std::vector<ClassStereotype>& types) {
    std::string out;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += i + 1 == types.size() ? " or " : ", ";
        out += guillemets(to_string(types[i]));
    }
    return out;
}

std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
    constexpr std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    return b > max - a ? max : a + b;
}

bool allows(const std::vector<ClassStereotype>& types, ClassStereotype s) {
    return types.empty() || std::find(types.begin(), types.end(), s) != types.end();
}

} // namespace

StructuralValidator::StructuralValidator(const ClassifierGraph& graph)
    : graph_(graph)
{
}

ValidationProblems StructuralValidator::run() {
    problems_.clear();
    records_.clear();
    for (ElementId id : graph_.classes())
        records_.emplace(id, ClassRecord{});

    for_each_element(graph_.model(), [this](ElementId id, const ontouml_model::Element& e) {
        if (const auto* c = std::get_if<ontouml_model::Class>(&e))
            check_class(id, *c);
        else if (const auto* g = std::get_if<ontouml_model::Generalization>(&e))
            check_generalization(id, *g);
        else if (const auto* a = std::get_if<ontouml_model::Association>(&e))
            check_association(id, *a);
    });
    check_aggregates();
    return problems_;
}

const IdentityInterval* StructuralValidator::identity_interval(ElementId cls) const {
    auto it = records_.find(cls);
    return it == records_.end() ? nullptr : &it->second.identity;
}

void StructuralValidator::error(ElementId element, ErrorKind kind, std::string message) {
    problems_.push_back(ErrorProblem{element, kind, std::move(message)});
}

void StructuralValidator::check_class(ElementId id, const ontouml_model::Class& cls) {
    const auto stereotype = graph_.stereotype_of(id);
    if (!stereotype) {
        if (cls.stereotype.empty())
            error(id, ErrorKind::InvalidStereotype, "class has no stereotype");
        else
            error(id, ErrorKind::InvalidStereotype, "unknown class stereotype " + guillemets(cls.stereotype));
        return;
    }
    if (is_identity_provider(*stereotype)) {
        auto& identity = records_[id].identity;
        identity.min += 1;
        identity.max += 1;
    }
}

void StructuralValidator::check_generalization(ElementId id, const ontouml_model::Generalization& g) {
    if (g.sources.empty()) error(id, ErrorKind::InvalidReference, "generalization has no subtype");
    if (g.targets.empty()) error(id, ErrorKind::InvalidReference, "generalization has no supertype");

    // Repeated ids name the same edge once, as in ClassifierGraph.
    std::vector<ElementId> sources;
    std::vector<ElementId> targets;
    for (ElementId s : g.sources) {
        if (!graph_.info(s)) error(id, ErrorKind::InvalidReference, "generalization subtype is not a class");
        else if (std::find(sources.begin(), sources.end(), s) == sources.end()) sources.push_back(s);
    }
    for (ElementId t : g.targets) {
        if (!graph_.info(t)) error(id, ErrorKind::InvalidReference, "generalization supertype is not a class");
        else if (std::find(targets.begin(), targets.end(), t) == targets.end()) targets.push_back(t);
    }

    for (ElementId s : sources) {
        const auto ss = graph_.stereotype_of(s);
        if (!ss) continue;
        for (ElementId t : targets) {
            const auto ts = graph_.stereotype_of(t);
            if (ts && !valid_subtyping(*ss, *ts)) {
                error(id, ErrorKind::InvalidSubtyping,
                    guillemets(to_string(*ss)) + " cannot be subtype of " + guillemets(to_string(*ts)));
            }
        }
    }

    if (targets.empty()) return;

    const std::size_t providers = static_cast<std::size_t>(std::count_if(targets.begin(), targets.end(),
        [this](ElementId t) {
            const auto ts = graph_.stereotype_of(t);
            return ts && (is_identity_provider(*ts) || requires_identity(*ts));
        }));
    const bool singleton = sources.size() == 1 && targets.size() == 1;

    IdentityInterval weight;
    if (g.set_is_disjoint || singleton) {
        weight.min = providers == targets.size() ? 1 : 0;
        weight.max = std::min<std::size_t>(providers, 1);
    } else if (g.set_is_covering) {
        weight.min = std::min<std::size_t>(providers, 1);
        weight.max = providers;
    } else {
        weight.min = 0;
        weight.max = providers + 1;
    }
    for (ElementId s : sources) {
        auto& identity = records_[s].identity;
        identity.min += weight.min;
        identity.max += weight.max;
    }
}

void StructuralValidator::check_association(ElementId id, const ontouml_model::Association& a) {
    const auto& model = graph_.model();
    bool dangling = false;
    if (!model.is_classifier(a.source.classifier)) {
        error(id, ErrorKind::InvalidReference, "association source is not a classifier");
        dangling = true;
    }
    if (!model.is_classifier(a.target.classifier)) {
        error(id, ErrorKind::InvalidReference, "association target is not a classifier");
        dangling = true;
    }

    const auto stereotype = parse_association_stereotype(a.stereotype);
    if (!stereotype)
        error(id, ErrorKind::InvalidStereotype, "unknown association stereotype " + guillemets(a.stereotype));

    const auto source = parse_multiplicity(a.source.multiplicity);
    const auto target = parse_multiplicity(a.target.multiplicity);
    const auto check_end = [&](const char* end, const std::string& text, const std::optional<Multiplicity>& m) {
        if (!m) {
            error(id, ErrorKind::InvalidRelationMultiplicities,
                std::string(end) + " multiplicity '" + text + "' is not valid");
        } else if (!m->is_consistent()) {
            error(id, ErrorKind::InvalidRelationMultiplicities,
                std::string(end) + " multiplicity " + to_string(*m) + " has upper bound below lower bound");
        }
    };
    check_end("source", a.source.multiplicity, source);
    check_end("target", a.target.multiplicity, target);

    if (stereotype && !dangling)
        check_relation_rules(id, *stereotype, a, source, target);
}

void StructuralValidator::check_relation_rules(ElementId id, AssociationStereotype stereotype,
    const ontouml_model::Association& a,
    const std::optional<Multiplicity>& source,
    const std::optional<Multiplicity>& target)
{
    const RelationRule rule = relation_rule(stereotype);
    const std::string name = guillemets(to_string(stereotype));

    const bool source_ok = source && source->is_consistent();
    const bool target_ok = target && target->is_consistent();
    if (source_ok && rule.source.constrained() && !rule.source.accepts(*source)) {
        error(id, ErrorKind::InvalidRelationMultiplicities,
            name + " requires source multiplicity " + describe_shape(rule.source)
                + " (found " + to_string(*source) + ")");
    }
    if (target_ok && rule.target.constrained() && !rule.target.accepts(*target)) {
        error(id, ErrorKind::InvalidRelationMultiplicities,
            name + " requires target multiplicity " + describe_shape(rule.target)
                + " (found " + to_string(*target) + ")");
    }

    // Instance ends and classes with unknown stereotypes are not constrained here.
    const auto check_type = [&](const char* end, ElementId classifier, const std::vector<ClassStereotype>& types) {
        const auto s = graph_.stereotype_of(classifier);
        if (!s || allows(types, *s)) return;
        error(id, ErrorKind::InvalidRelationEndpoints,
            name + " " + end + " must be " + describe_types(types)
                + " (found " + guillemets(to_string(*s)) + ")");
    };
    check_type("source", a.source.classifier, rule.source_types);
    check_type("target", a.target.classifier, rule.target_types);

    if (stereotype == AssociationStereotype::Mediation && source_ok && target_ok) {
        if (graph_.info(a.source.classifier)) {
            auto& lower = records_[a.source.classifier].opposing_mediation_lower;
            lower = saturating_add(lower, target->lower);
        }
        if (graph_.info(a.target.classifier)) {
            auto& lower = records_[a.target.classifier].opposing_mediation_lower;
            lower = saturating_add(lower, source->lower);
        }
    }
}

std::uint64_t StructuralValidator::mediated_lower_bound(ElementId cls) const {
    MediationWalk walk;
    return mediated_lower_bound(cls, walk);
}

// Results computed without reaching a node on the current path do not depend on that
// path and are memoized, so shared ancestors are summed once per walk.
std::uint64_t StructuralValidator::mediated_lower_bound(ElementId cls, MediationWalk& walk) const {
    const ClassifierInfo* info = graph_.info(cls);
    if (!info) return 0;
    if (auto it = walk.memo.find(cls); it != walk.memo.end()) return it->second;
    if (!walk.on_path.insert(cls).second) {
        walk.cut = true;
        return 0;
    }
    const bool outer_cut = walk.cut;
    walk.cut = false;

    std::uint64_t total = 0;
    if (auto it = records_.find(cls); it != records_.end())
        total = it->second.opposing_mediation_lower;

    for (ElementId g_id : info->generalizations_as_source) {
        const auto* g = graph_.model().get<ontouml_model::Generalization>(g_id);
        if (!g) continue;
        std::uint64_t sum = 0;
        std::uint64_t least = std::numeric_limits<std::uint64_t>::max();
        std::vector<ElementId> seen;
        for (ElementId t : g->targets) {
            if (!graph_.info(t) || std::find(seen.begin(), seen.end(), t) != seen.end()) continue;
            seen.push_back(t);
            const std::uint64_t bound = mediated_lower_bound(t, walk);
            sum = saturating_add(sum, bound);
            least = std::min(least, bound);
        }
        if (!seen.empty()) total = saturating_add(total, g->set_is_disjoint ? least : sum);
    }

    walk.on_path.erase(cls);
    if (!walk.cut) walk.memo.emplace(cls, total);
    walk.cut = walk.cut || outer_cut;
    return total;
}

void StructuralValidator::check_aggregates() {
    for (ElementId id : graph_.classes()) {
        const ClassifierInfo* info = graph_.info(id);
        if (!info || !info->stereotype) continue;
        const ClassStereotype s = *info->stereotype;
        const IdentityInterval& identity = records_[id].identity;

        if (requires_identity(s) && !identity.is_exactly_one()) {
            error(id, ErrorKind::InvalidIdentity,
                "element does not have exactly one identity provider (found "
                    + std::to_string(identity.min) + ".." + std::to_string(identity.max) + ")");
        }

        if (s == S::Role && mediated_lower_bound(id) == 0)
            error(id, ErrorKind::InvalidRole, "role is not mediated by any relator");

        if (!info->is_abstract() && graph_.has_stereotype_in_lineage(id, S::Relator)) {
            const std::uint64_t mediated = mediated_lower_bound(id);
            if (mediated < 2) {
                error(id, ErrorKind::InvalidRelator,
                    "relator must mediate at least two individuals (found " + std::to_string(mediated) + ")");
            }
        }

        if (s == S::Phase) {
            const bool partitioned = std::any_of(info->generalizations_as_source.begin(),
                info->generalizations_as_source.end(), [this](ElementId g_id) {
                    const auto* g = graph_.model().get<ontouml_model::Generalization>(g_id);
                    return g && g->set_is_disjoint && g->set_is_covering;
                });
            if (!partitioned)
                error(id, ErrorKind::InvalidPhase, "phase is not part of a disjoint and complete generalization set");
        }

        if (is_mixin_like(s) && !info->is_abstract()) {
            error(id, ErrorKind::InvalidNonabstractMixin,
                guillemets(to_string(s)) + " must be abstract");
        }

        if ((s == S::Quality || s == S::Mode) && !info->characterized) {
            error(id, ErrorKind::InvalidMissingCharacterization,
                guillemets(to_string(s)) + " is not the target of any characterization");
        }
    }
}

ValidationProblems validate_structure(const ClassifierGraph& graph) {
    StructuralValidator validator(graph);
    return validator.run();
}

} // namespace ontouml_validation
