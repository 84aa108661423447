#include <ontouml_validation/diagnostic_sink.hpp>

namespace ontouml_validation {

ResultRow make_row(const ValidationProblem& problem) {
    ResultRow row;
    row.element = problem_element(problem);
    if (const auto* e = std::get_if<ErrorProblem>(&problem)) {
        row.category = "Error";
        row.text = e->message.empty() ? std::string(to_string(e->kind)) : e->message;
    } else if (const auto* a = std::get_if<AntiPatternProblem>(&problem)) {
        row.category = "Anti-Pattern";
        row.text = std::string(to_string(a->kind));
    }
    return row;
}

void report_problems(const ValidationProblems& problems, DiagnosticSink& sink) {
    for (const auto& p : problems) {
        sink.highlight(problem_element(p), is_error(p) ? Severity::Error : Severity::Warning);
        sink.add_row(make_row(p));
    }
}

} // namespace ontouml_validation
