#pragma once

#include <ontouml_model/model.hpp>
#include <ontouml_validation/problem.hpp>
#include <string>

namespace ontouml_validation {

enum class Severity { Error, Warning };

struct ResultRow {
    std::string category;  // "Error" or "Anti-Pattern"
    std::string text;
    ElementId element = ontouml_model::invalid_element;
};

// Host-side consumer of validation results: highlights the offending element and
// renders one results-table row per problem.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void highlight(ElementId element, Severity severity) = 0;
    virtual void add_row(const ResultRow& row) = 0;
};

ResultRow make_row(const ValidationProblem& problem);

// Issues one highlight and one row per problem, in order.
void report_problems(const ValidationProblems& problems, DiagnosticSink& sink);

} // namespace ontouml_validation
