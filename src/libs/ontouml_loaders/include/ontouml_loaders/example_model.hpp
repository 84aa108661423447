#pragma once

#include <ontouml_model/model.hpp>

namespace ontouml_loaders {

// Small demo diagram: Animal/Human with a life phase partition and a Marriage relator.
ontouml_model::Model generate_example_model();

} // namespace ontouml_loaders
