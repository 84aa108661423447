#pragma once

#include <ontouml_model/model.hpp>
#include <optional>
#include <istream>
#include <string>

namespace ontouml_loaders {

// Reads a model from the JSON layout {"name", "elements": [...]} where each element
// carries "type" and a unique "id". Unknown reference ids resolve to invalid_element.
std::optional<ontouml_model::Model> load_model_from_json(std::istream& in);
std::optional<ontouml_model::Model> load_model_from_json_file(const std::string& path);

} // namespace ontouml_loaders
