#pragma once

#include <ontouml_model/model.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ontouml_validation {

using ontouml_model::ElementId;

enum class ErrorKind {
    InvalidStereotype,
    InvalidSubtyping,
    InvalidRelationMultiplicities,
    InvalidRelationEndpoints,
    InvalidReference,
    InvalidIdentity,
    InvalidRole,
    InvalidRelator,
    InvalidPhase,
    InvalidNonabstractMixin,
    InvalidMissingCharacterization,
};

enum class AntiPatternKind {
    BinOver,      // binary relation between overlapping types
    DecInt,       // deceiving intersection
    DepPhase,     // relationally dependent phase
    FreeRole,     // free role specialization
    GSRig,        // generalization set with mixed rigidity
    HetColl,      // heterogeneous collective
    HomoFunc,     // homogeneous functional complex
    MixRig,       // mixin with uniform rigidity
    MultDep,      // multiple relational dependency
    RelRig,       // relator mediating rigid types
    UndefFormal,  // undefined formal association
    UndefPhase,   // undefined phase partition
};

struct ErrorProblem {
    ElementId element;
    ErrorKind kind;
    std::string message;
};

struct AntiPatternProblem {
    ElementId element;
    AntiPatternKind kind;
};

using ValidationProblem = std::variant<ErrorProblem, AntiPatternProblem>;
using ValidationProblems = std::vector<ValidationProblem>;

std::string_view to_string(ErrorKind kind);
std::string_view to_string(AntiPatternKind kind);

ElementId problem_element(const ValidationProblem& problem);
bool is_error(const ValidationProblem& problem);

std::size_t count_errors(const ValidationProblems& problems, ErrorKind kind);
std::size_t count_errors(const ValidationProblems& problems, ErrorKind kind, ElementId element);
std::size_t count_antipatterns(const ValidationProblems& problems, AntiPatternKind kind);
std::size_t count_antipatterns(const ValidationProblems& problems, AntiPatternKind kind, ElementId element);

} // namespace ontouml_validation
