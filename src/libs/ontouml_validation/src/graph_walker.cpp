#include <ontouml_validation/graph_walker.hpp>
#include <algorithm>
#include <cctype>
#include <deque>

namespace ontouml_validation {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

void push_unique(std::vector<ElementId>& v, ElementId id) {
    if (std::find(v.begin(), v.end(), id) == v.end()) v.push_back(id);
}

// First candidate lying on the lineage of `member` (member is that candidate or below it).
std::optional<ElementId> branch_above(const ClassifierGraph& graph,
    const std::vector<ElementId>& candidates, ElementId member)
{
    for (ElementId c : candidates)
        if (graph.is_same_or_subtype_of(member, c)) return c;
    return std::nullopt;
}

// First candidate lying below `member`.
std::optional<ElementId> branch_below(const ClassifierGraph& graph,
    const std::vector<ElementId>& candidates, ElementId member)
{
    for (ElementId c : candidates)
        if (graph.is_same_or_subtype_of(c, member)) return c;
    return std::nullopt;
}

} // namespace

ClassifierGraph::ClassifierGraph(const Model& model)
    : model_(model)
{
    // Classes first so that edges may reference classes declared later in the tree.
    for_each_element(model_, [this](ElementId id, const ontouml_model::Element& e) {
        if (const auto* c = std::get_if<ontouml_model::Class>(&e)) collect_class(id, *c);
    });
    for_each_element(model_, [this](ElementId id, const ontouml_model::Element& e) {
        if (const auto* g = std::get_if<ontouml_model::Generalization>(&e))
            collect_generalization(id, *g);
        else if (const auto* a = std::get_if<ontouml_model::Association>(&e))
            collect_association(id, *a);
    });
}

void ClassifierGraph::collect_class(ElementId id, const ontouml_model::Class& cls) {
    ClassifierInfo info;
    info.id = id;
    info.cls = &cls;
    info.stereotype = parse_class_stereotype(cls.stereotype);
    infos_.emplace(id, std::move(info));
    classes_.push_back(id);
}

void ClassifierGraph::collect_generalization(ElementId id, const ontouml_model::Generalization& g) {
    generalizations_.push_back(id);
    for (ElementId s : g.sources) {
        ClassifierInfo* source = mutable_info(s);
        if (!source) continue;
        push_unique(source->generalizations_as_source, id);
        for (ElementId t : g.targets) {
            ClassifierInfo* target = mutable_info(t);
            if (!target) continue;
            push_unique(source->parents, t);
            push_unique(target->children, s);
        }
    }
    for (ElementId t : g.targets) {
        if (ClassifierInfo* target = mutable_info(t))
            push_unique(target->generalizations_as_target, id);
    }
}

void ClassifierGraph::collect_association(ElementId id, const ontouml_model::Association& a) {
    associations_.push_back(id);
    ClassifierInfo* source = mutable_info(a.source.classifier);
    ClassifierInfo* target = mutable_info(a.target.classifier);
    if (source) push_unique(source->associations, id);
    if (target) push_unique(target->associations, id);

    if (parse_association_stereotype(a.stereotype) == AssociationStereotype::Characterization) {
        if (source) source->bears_characterization = true;
        if (target) target->characterized = true;
    }
}

ClassifierInfo* ClassifierGraph::mutable_info(ElementId id) {
    auto it = infos_.find(id);
    return it == infos_.end() ? nullptr : &it->second;
}

const ClassifierInfo* ClassifierGraph::info(ElementId id) const {
    auto it = infos_.find(id);
    return it == infos_.end() ? nullptr : &it->second;
}

std::optional<ClassStereotype> ClassifierGraph::stereotype_of(ElementId id) const {
    const ClassifierInfo* i = info(id);
    return i ? i->stereotype : std::nullopt;
}

std::optional<AssociationStereotype> ClassifierGraph::association_stereotype(ElementId association) const {
    const auto* a = model_.get<ontouml_model::Association>(association);
    if (!a) return std::nullopt;
    return parse_association_stereotype(a->stereotype);
}

bool ClassifierGraph::is_subtype_of(ElementId a, ElementId b) const {
    std::unordered_set<ElementId> on_path;
    std::unordered_set<ElementId> exhausted;
    return reaches_ancestor(a, b, on_path, exhausted);
}

bool ClassifierGraph::is_same_or_subtype_of(ElementId a, ElementId b) const {
    return a == b || is_subtype_of(a, b);
}

// `on_path` breaks cycles; `exhausted` holds nodes already searched without success in
// this query, so shared ancestors are explored once.
bool ClassifierGraph::reaches_ancestor(ElementId from, ElementId ancestor,
    std::unordered_set<ElementId>& on_path, std::unordered_set<ElementId>& exhausted) const
{
    const ClassifierInfo* i = info(from);
    if (!i || exhausted.count(from) || !on_path.insert(from).second) return false;
    bool found = false;
    for (ElementId p : i->parents) {
        if (p == ancestor || reaches_ancestor(p, ancestor, on_path, exhausted)) {
            found = true;
            break;
        }
    }
    on_path.erase(from);
    if (!found) exhausted.insert(from);
    return found;
}

std::optional<ElementId> ClassifierGraph::least_upper_bound(ElementId a, ElementId b) const {
    if (!info(a) || !info(b)) return std::nullopt;
    std::deque<ElementId> queue{a};
    std::unordered_set<ElementId> seen{a};
    while (!queue.empty()) {
        const ElementId x = queue.front();
        queue.pop_front();
        if (is_same_or_subtype_of(b, x)) return x;
        for (ElementId p : info(x)->parents)
            if (seen.insert(p).second) queue.push_back(p);
    }
    return std::nullopt;
}

std::optional<ElementId> ClassifierGraph::greatest_lower_bound(ElementId a, ElementId b) const {
    if (!info(a) || !info(b)) return std::nullopt;
    std::deque<ElementId> queue{b};
    std::unordered_set<ElementId> seen{b};
    while (!queue.empty()) {
        const ElementId x = queue.front();
        queue.pop_front();
        if (is_same_or_subtype_of(x, a)) return x;
        for (ElementId c : info(x)->children)
            if (seen.insert(c).second) queue.push_back(c);
    }
    return std::nullopt;
}

bool ClassifierGraph::are_disjoint_upwards(ElementId a, ElementId b) const {
    const auto bound = least_upper_bound(a, b);
    if (!bound) return true;
    for (ElementId g_id : info(*bound)->generalizations_as_target) {
        const auto* g = model_.get<ontouml_model::Generalization>(g_id);
        if (!g || !g->set_is_disjoint) continue;
        const auto branch_a = branch_above(*this, g->sources, a);
        const auto branch_b = branch_above(*this, g->sources, b);
        if (branch_a && branch_b && *branch_a != *branch_b) return true;
    }
    return false;
}

bool ClassifierGraph::are_disjoint_downwards(ElementId a, ElementId b) const {
    const auto bound = greatest_lower_bound(a, b);
    if (!bound) return true;
    for (ElementId g_id : info(*bound)->generalizations_as_source) {
        const auto* g = model_.get<ontouml_model::Generalization>(g_id);
        if (!g || !g->set_is_disjoint) continue;
        const auto branch_a = branch_below(*this, g->targets, a);
        const auto branch_b = branch_below(*this, g->targets, b);
        if (branch_a && branch_b && *branch_a != *branch_b) return true;
    }
    return false;
}

bool ClassifierGraph::any_in_lineage(ElementId id,
    const std::function<bool(const ClassifierInfo&)>& pred) const
{
    std::unordered_set<ElementId> on_path;
    std::unordered_set<ElementId> exhausted;
    return lineage_matches(id, pred, on_path, exhausted);
}

bool ClassifierGraph::lineage_matches(ElementId id,
    const std::function<bool(const ClassifierInfo&)>& pred,
    std::unordered_set<ElementId>& on_path, std::unordered_set<ElementId>& exhausted) const
{
    const ClassifierInfo* i = info(id);
    if (!i || exhausted.count(id) || !on_path.insert(id).second) return false;
    bool found = pred(*i);
    for (auto it = i->parents.begin(); !found && it != i->parents.end(); ++it)
        found = lineage_matches(*it, pred, on_path, exhausted);
    on_path.erase(id);
    if (!found) exhausted.insert(id);
    return found;
}

bool ClassifierGraph::has_stereotype_in_lineage(ElementId id, ClassStereotype stereotype) const {
    return any_in_lineage(id, [stereotype](const ClassifierInfo& i) {
        return i.stereotype == stereotype;
    });
}

bool ClassifierGraph::has_intrinsic_properties(ElementId id) const {
    return any_in_lineage(id, [](const ClassifierInfo& i) {
        return i.bears_characterization || !is_blank(i.cls->properties);
    });
}

} // namespace ontouml_validation
