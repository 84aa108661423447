#include <ontouml_validation/validator.hpp>
#include <ontouml_validation/antipattern_validator.hpp>
#include <ontouml_validation/graph_walker.hpp>
#include <ontouml_validation/logger.hpp>
#include <ontouml_validation/structural_validator.hpp>

namespace ontouml_validation {

ValidationProblems validate(const ontouml_model::Model& model, const ValidationOptions& options) {
    ValidationProblems problems;
    if (!options.check_errors && !options.check_antipatterns) return problems;

    auto logger = validation_logger();
    if (!model.root_package()) {
        logger->warn("model '{}' has no root package; nothing to validate", model.name);
        return problems;
    }

    const ClassifierGraph graph(model);
    logger->debug("collected {} classes, {} generalizations, {} associations",
        graph.classes().size(), graph.generalizations().size(), graph.associations().size());

    if (options.check_errors) {
        ValidationProblems errors = validate_structure(graph);
        logger->debug("structural pass: {} errors", errors.size());
        problems.insert(problems.end(), errors.begin(), errors.end());
    }
    if (options.check_antipatterns) {
        ValidationProblems antipatterns = validate_antipatterns(graph);
        logger->debug("anti-pattern pass: {} findings", antipatterns.size());
        problems.insert(problems.end(), antipatterns.begin(), antipatterns.end());
    }
    return problems;
}

} // namespace ontouml_validation
