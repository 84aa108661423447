#pragma once

#include <ontouml_model/model.hpp>
#include <ontouml_validation/problem.hpp>

namespace ontouml_validation {

struct ValidationOptions {
    bool check_errors = true;
    bool check_antipatterns = false;
};

// One validation run over a read-only model. Errors come first, then anti-patterns,
// each in element traversal order. Nothing is cached between calls.
ValidationProblems validate(const ontouml_model::Model& model, const ValidationOptions& options = {});

} // namespace ontouml_validation
