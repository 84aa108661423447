#include <ontouml_loaders/json_loader.hpp>
#include <ontouml_model/model_builder.hpp>
#include <ontouml_validation/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ontouml_loaders {

namespace {

using ontouml_model::ElementId;
using ontouml_model::invalid_element;

std::string get_string(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

bool get_bool(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : false;
}

ontouml_model::Navigability navigability_from_string(const std::string& s) {
    if (s == "navigable") return ontouml_model::Navigability::Navigable;
    if (s == "non_navigable") return ontouml_model::Navigability::NonNavigable;
    return ontouml_model::Navigability::Unspecified;
}

ontouml_model::Aggregation aggregation_from_string(const std::string& s) {
    if (s == "shared") return ontouml_model::Aggregation::Shared;
    if (s == "composite") return ontouml_model::Aggregation::Composite;
    return ontouml_model::Aggregation::None;
}

class ModelReader {
public:
    explicit ModelReader(std::string name)
        : builder_(std::move(name))
    {
    }

    // First pass: create every element and record containment; references stay unresolved.
    bool read_elements(const nlohmann::json& elements, ElementId package) {
        for (const auto& e : elements) {
            if (!e.is_object()) return fail("element is not an object");
            const std::string uuid = get_string(e, "id");
            const std::string type = get_string(e, "type");
            if (uuid.empty()) return fail("element without id");
            if (ids_.count(uuid)) return fail("duplicate element id '" + uuid + "'");

            ElementId id = invalid_element;
            if (type == "package") {
                ontouml_model::Package p;
                p.uuid = uuid;
                p.name = get_string(e, "name");
                p.comment = get_string(e, "comment");
                id = builder_.add_detached(std::move(p));
            } else if (type == "class") {
                ontouml_model::Class c;
                c.uuid = uuid;
                c.name = get_string(e, "name");
                c.stereotype = get_string(e, "stereotype");
                c.is_abstract = get_bool(e, "is_abstract");
                c.properties = get_string(e, "properties");
                c.functions = get_string(e, "functions");
                c.comment = get_string(e, "comment");
                id = builder_.add_detached(std::move(c));
            } else if (type == "instance") {
                ontouml_model::Instance i;
                i.uuid = uuid;
                i.instance_name = get_string(e, "name");
                i.instance_type = get_string(e, "instance_type");
                i.instance_slots = get_string(e, "slots");
                i.comment = get_string(e, "comment");
                id = builder_.add_detached(std::move(i));
            } else if (type == "generalization") {
                ontouml_model::Generalization g;
                g.uuid = uuid;
                g.set_name = get_string(e, "set_name");
                g.set_is_disjoint = get_bool(e, "is_disjoint");
                g.set_is_covering = get_bool(e, "is_covering");
                g.comment = get_string(e, "comment");
                id = builder_.add_detached(std::move(g));
            } else if (type == "association") {
                ontouml_model::Association a;
                a.uuid = uuid;
                a.stereotype = get_string(e, "stereotype");
                a.comment = get_string(e, "comment");
                id = builder_.add_detached(std::move(a));
            } else if (type == "dependency") {
                ontouml_model::Dependency d;
                d.uuid = uuid;
                d.stereotype = get_string(e, "stereotype");
                d.target_arrow_open = get_bool(e, "target_arrow_open");
                d.comment = get_string(e, "comment");
                id = builder_.add_detached(std::move(d));
            } else if (type == "comment") {
                ontouml_model::Comment c;
                c.uuid = uuid;
                c.text = get_string(e, "text");
                id = builder_.add_detached(std::move(c));
            } else if (type == "comment_link") {
                ontouml_model::CommentLink l;
                l.uuid = uuid;
                id = builder_.add_detached(std::move(l));
            } else {
                return fail("element '" + uuid + "' has unknown type '" + type + "'");
            }

            ids_.emplace(uuid, id);
            builder_.place(id, package);
            pending_.emplace_back(id, &e);

            if (type == "package" && e.contains("elements")) {
                if (!e["elements"].is_array()) return fail("package '" + uuid + "' elements is not an array");
                if (!read_elements(e["elements"], id)) return false;
            }
        }
        return true;
    }

    // Second pass: resolve reference ids now that every element exists.
    void resolve_references() {
        for (const auto& [id, json] : pending_) {
            const nlohmann::json& e = *json;
            auto& element = builder_.at(id);
            if (auto* g = std::get_if<ontouml_model::Generalization>(&element)) {
                g->sources = resolve_list(e, "sources");
                g->targets = resolve_list(e, "targets");
            } else if (auto* a = std::get_if<ontouml_model::Association>(&element)) {
                a->source = read_end(e, "source");
                a->target = read_end(e, "target");
            } else if (auto* d = std::get_if<ontouml_model::Dependency>(&element)) {
                d->source = resolve(get_string(e, "source"));
                d->target = resolve(get_string(e, "target"));
            } else if (auto* l = std::get_if<ontouml_model::CommentLink>(&element)) {
                l->source = resolve(get_string(e, "source"));
                l->target = resolve(get_string(e, "target"));
            }
        }
    }

    ElementId root() const { return builder_.root(); }
    ontouml_model::Model build() { return builder_.build(); }

private:
    bool fail(const std::string& reason) {
        ontouml_validation::validation_logger()->warn("rejecting model: {}", reason);
        return false;
    }

    ElementId resolve(const std::string& uuid) {
        auto it = ids_.find(uuid);
        if (it != ids_.end()) return it->second;
        if (!uuid.empty())
            ontouml_validation::validation_logger()->warn("unresolved reference '{}'", uuid);
        return invalid_element;
    }

    std::vector<ElementId> resolve_list(const nlohmann::json& e, const char* key) {
        std::vector<ElementId> out;
        if (!e.contains(key) || !e[key].is_array()) return out;
        for (const auto& ref : e[key])
            out.push_back(ref.is_string() ? resolve(ref.get<std::string>()) : invalid_element);
        return out;
    }

    ontouml_model::AssociationEnd read_end(const nlohmann::json& e, const char* key) {
        ontouml_model::AssociationEnd end;
        if (!e.contains(key) || !e[key].is_object()) return end;
        const auto& j = e[key];
        end.classifier = resolve(get_string(j, "element"));
        end.multiplicity = get_string(j, "multiplicity");
        end.role = get_string(j, "role");
        end.reading = get_string(j, "reading");
        end.navigability = navigability_from_string(get_string(j, "navigability"));
        end.aggregation = aggregation_from_string(get_string(j, "aggregation"));
        return end;
    }

    ontouml_model::ModelBuilder builder_;
    std::unordered_map<std::string, ElementId> ids_;
    std::vector<std::pair<ElementId, const nlohmann::json*>> pending_;
};

std::optional<ontouml_model::Model> parse_model_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("elements") || !j["elements"].is_array()) {
        ontouml_validation::validation_logger()->warn("rejecting model: missing 'elements' array");
        return std::nullopt;
    }

    ModelReader reader(get_string(j, "name"));
    if (!reader.read_elements(j["elements"], reader.root())) return std::nullopt;
    reader.resolve_references();
    return reader.build();
}

} // namespace

std::optional<ontouml_model::Model> load_model_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_model_json(j);
    } catch (const nlohmann::json::exception& e) {
        ontouml_validation::validation_logger()->warn("invalid model JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ontouml_model::Model> load_model_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        ontouml_validation::validation_logger()->warn("cannot open model file '{}'", path);
        return std::nullopt;
    }
    return load_model_from_json(f);
}

} // namespace ontouml_loaders
