#include <ontouml_validation/problem.hpp>
#include <algorithm>

namespace ontouml_validation {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidStereotype: return "InvalidStereotype";
    case ErrorKind::InvalidSubtyping: return "InvalidSubtyping";
    case ErrorKind::InvalidRelationMultiplicities: return "InvalidRelation(Multiplicities)";
    case ErrorKind::InvalidRelationEndpoints: return "InvalidRelation(Endpoints)";
    case ErrorKind::InvalidReference: return "InvalidReference";
    case ErrorKind::InvalidIdentity: return "InvalidIdentity";
    case ErrorKind::InvalidRole: return "InvalidRole";
    case ErrorKind::InvalidRelator: return "InvalidRelator";
    case ErrorKind::InvalidPhase: return "InvalidPhase";
    case ErrorKind::InvalidNonabstractMixin: return "InvalidNonabstractMixin";
    case ErrorKind::InvalidMissingCharacterization: return "InvalidMissingCharacterization";
    }
    return "";
}

std::string_view to_string(AntiPatternKind kind) {
    switch (kind) {
    case AntiPatternKind::BinOver: return "BinOver";
    case AntiPatternKind::DecInt: return "DecInt";
    case AntiPatternKind::DepPhase: return "DepPhase";
    case AntiPatternKind::FreeRole: return "FreeRole";
    case AntiPatternKind::GSRig: return "GSRig";
    case AntiPatternKind::HetColl: return "HetColl";
    case AntiPatternKind::HomoFunc: return "HomoFunc";
    case AntiPatternKind::MixRig: return "MixRig";
    case AntiPatternKind::MultDep: return "MultDep";
    case AntiPatternKind::RelRig: return "RelRig";
    case AntiPatternKind::UndefFormal: return "UndefFormal";
    case AntiPatternKind::UndefPhase: return "UndefPhase";
    }
    return "";
}

ElementId problem_element(const ValidationProblem& problem) {
    return std::visit([](const auto& p) { return p.element; }, problem);
}

bool is_error(const ValidationProblem& problem) {
    return std::holds_alternative<ErrorProblem>(problem);
}

std::size_t count_errors(const ValidationProblems& problems, ErrorKind kind) {
    return static_cast<std::size_t>(std::count_if(problems.begin(), problems.end(),
        [&](const ValidationProblem& p) {
            const auto* e = std::get_if<ErrorProblem>(&p);
            return e && e->kind == kind;
        }));
}

std::size_t count_errors(const ValidationProblems& problems, ErrorKind kind, ElementId element) {
    return static_cast<std::size_t>(std::count_if(problems.begin(), problems.end(),
        [&](const ValidationProblem& p) {
            const auto* e = std::get_if<ErrorProblem>(&p);
            return e && e->kind == kind && e->element == element;
        }));
}

std::size_t count_antipatterns(const ValidationProblems& problems, AntiPatternKind kind) {
    return static_cast<std::size_t>(std::count_if(problems.begin(), problems.end(),
        [&](const ValidationProblem& p) {
            const auto* a = std::get_if<AntiPatternProblem>(&p);
            return a && a->kind == kind;
        }));
}

std::size_t count_antipatterns(const ValidationProblems& problems, AntiPatternKind kind, ElementId element) {
    return static_cast<std::size_t>(std::count_if(problems.begin(), problems.end(),
        [&](const ValidationProblem& p) {
            const auto* a = std::get_if<AntiPatternProblem>(&p);
            return a && a->kind == kind && a->element == element;
        }));
}

} // namespace ontouml_validation
