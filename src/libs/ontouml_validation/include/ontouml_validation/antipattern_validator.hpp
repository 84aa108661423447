#pragma once

#include <ontouml_validation/graph_walker.hpp>
#include <ontouml_validation/problem.hpp>

namespace ontouml_validation {

// Each detector appends its findings in traversal order and is independent of the others.
void detect_bin_over(const ClassifierGraph& graph, ValidationProblems& out);
void detect_dec_int(const ClassifierGraph& graph, ValidationProblems& out);
void detect_dep_phase(const ClassifierGraph& graph, ValidationProblems& out);
void detect_free_role(const ClassifierGraph& graph, ValidationProblems& out);
void detect_gs_rig(const ClassifierGraph& graph, ValidationProblems& out);
void detect_het_coll(const ClassifierGraph& graph, ValidationProblems& out);
void detect_homo_func(const ClassifierGraph& graph, ValidationProblems& out);
void detect_mix_rig(const ClassifierGraph& graph, ValidationProblems& out);
void detect_mult_dep(const ClassifierGraph& graph, ValidationProblems& out);
void detect_rel_rig(const ClassifierGraph& graph, ValidationProblems& out);
void detect_undef_formal(const ClassifierGraph& graph, ValidationProblems& out);
void detect_undef_phase(const ClassifierGraph& graph, ValidationProblems& out);

// All detectors, in the order declared above.
ValidationProblems validate_antipatterns(const ClassifierGraph& graph);

} // namespace ontouml_validation
