#include <ontouml_model/model_builder.hpp>
#include <stdexcept>
#include <utility>

namespace ontouml_model {

ModelBuilder::ModelBuilder(std::string model_name, std::string root_uuid) {
    model_.name = std::move(model_name);
    Package root;
    root.uuid = std::move(root_uuid);
    root.name = model_.name;
    model_.elements.emplace_back(std::move(root));
    model_.root = 0;
}

ElementId ModelBuilder::add_package(std::string uuid, std::string name, ElementId package) {
    Package p;
    p.uuid = std::move(uuid);
    p.name = std::move(name);
    return append(std::move(p), package);
}

ElementId ModelBuilder::add_class(std::string uuid, std::string name, std::string stereotype,
    bool is_abstract, std::string properties, ElementId package)
{
    Class c;
    c.uuid = std::move(uuid);
    c.name = std::move(name);
    c.stereotype = std::move(stereotype);
    c.is_abstract = is_abstract;
    c.properties = std::move(properties);
    return append(std::move(c), package);
}

ElementId ModelBuilder::add_instance(std::string uuid, std::string name, std::string type,
    ElementId package)
{
    Instance i;
    i.uuid = std::move(uuid);
    i.instance_name = std::move(name);
    i.instance_type = std::move(type);
    return append(std::move(i), package);
}

ElementId ModelBuilder::add_generalization(std::string uuid,
    std::vector<ElementId> sources,
    std::vector<ElementId> targets,
    bool is_disjoint,
    bool is_covering,
    ElementId package)
{
    Generalization g;
    g.uuid = std::move(uuid);
    g.sources = std::move(sources);
    g.targets = std::move(targets);
    g.set_is_disjoint = is_disjoint;
    g.set_is_covering = is_covering;
    return append(std::move(g), package);
}

ElementId ModelBuilder::add_association(std::string uuid, std::string stereotype,
    ElementId source, std::string source_multiplicity,
    ElementId target, std::string target_multiplicity,
    ElementId package)
{
    Association a;
    a.uuid = std::move(uuid);
    a.stereotype = std::move(stereotype);
    a.source.classifier = source;
    a.source.multiplicity = std::move(source_multiplicity);
    a.target.classifier = target;
    a.target.multiplicity = std::move(target_multiplicity);
    return append(std::move(a), package);
}

ElementId ModelBuilder::add_association(Association association, ElementId package) {
    return append(std::move(association), package);
}

ElementId ModelBuilder::add_dependency(std::string uuid, ElementId source, ElementId target,
    ElementId package)
{
    Dependency d;
    d.uuid = std::move(uuid);
    d.source = source;
    d.target = target;
    return append(std::move(d), package);
}

ElementId ModelBuilder::add_comment(std::string uuid, std::string text, ElementId package) {
    Comment c;
    c.uuid = std::move(uuid);
    c.text = std::move(text);
    return append(std::move(c), package);
}

ElementId ModelBuilder::add_comment_link(std::string uuid, ElementId comment, ElementId target,
    ElementId package)
{
    CommentLink l;
    l.uuid = std::move(uuid);
    l.source = comment;
    l.target = target;
    return append(std::move(l), package);
}

ElementId ModelBuilder::add_detached(Element element) {
    model_.elements.push_back(std::move(element));
    return model_.elements.size() - 1;
}

void ModelBuilder::place(ElementId element, ElementId package) {
    auto* p = std::get_if<Package>(&model_.elements.at(package));
    if (!p) throw std::invalid_argument("element " + model_.uuid_of(package) + " is not a package");
    p->contained_elements.push_back(element);
}

ElementId ModelBuilder::append(Element element, ElementId package) {
    const ElementId id = add_detached(std::move(element));
    place(id, package == invalid_element ? model_.root : package);
    return id;
}

} // namespace ontouml_model
