#include <ontouml_model/model.hpp>

namespace ontouml_model {

namespace {

const std::string empty_uuid;

} // namespace

const std::string& Model::uuid_of(ElementId id) const {
    if (!contains(id)) return empty_uuid;
    return std::visit([](const auto& e) -> const std::string& { return e.uuid; }, elements[id]);
}

std::string Model::label_of(ElementId id) const {
    if (const auto* c = get<Class>(id)) return c->name.empty() ? c->uuid : c->name;
    if (const auto* p = get<Package>(id)) return p->name.empty() ? p->uuid : p->name;
    if (const auto* i = get<Instance>(id)) return i->instance_name.empty() ? i->uuid : i->instance_name;
    return uuid_of(id);
}

} // namespace ontouml_model
