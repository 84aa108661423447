#include <gtest/gtest.h>
#include <ontouml_model/model_builder.hpp>
#include <ontouml_validation/stereotype.hpp>
#include <ontouml_validation/structural_validator.hpp>
#include <ontouml_validation/validator.hpp>
#include <cstdint>
#include <limits>
#include <string>

using namespace ontouml_validation;
using ontouml_model::ModelBuilder;

namespace {

ValidationProblems check(const ontouml_model::Model& model) {
    return validate(model, ValidationOptions{true, false});
}

} // namespace

TEST(StructuralValidatorTest, KindWithPartitionedSubkindIsClean) {
    ModelBuilder b("clean");
    const auto kind = b.add_class("kind", "Person", "kind");
    const auto sub = b.add_class("sub", "Adult", "subkind");
    b.add_generalization("g", {sub}, {kind}, true, true);

    EXPECT_TRUE(check(b.build()).empty());
}

TEST(StructuralValidatorTest, ReversedGeneralizationIsInvalidSubtyping) {
    ModelBuilder b("reversed");
    const auto kind = b.add_class("kind", "Person", "kind");
    const auto sub = b.add_class("sub", "Adult", "subkind");
    const auto g = b.add_generalization("g", {kind}, {sub});

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidSubtyping), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidSubtyping, g), 1u);
    const auto& first = std::get<ErrorProblem>(problems.front());
    EXPECT_EQ(first.message, "«kind» cannot be subtype of «subkind»");
}

TEST(StructuralValidatorTest, UnmediatedRoleIsInvalidRole) {
    ModelBuilder b("role");
    const auto role = b.add_class("role", "Customer", "role");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRole), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRole, role), 1u);
}

TEST(StructuralValidatorTest, UnknownOrMissingStereotype) {
    ModelBuilder b("stereotypes");
    const auto unknown = b.add_class("x", "X", "thing");
    const auto empty = b.add_class("y", "Y", "");
    const auto assoc = b.add_association("a", "likes", unknown, "1", empty, "1");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidStereotype, unknown), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidStereotype, empty), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidStereotype, assoc), 1u);
    // Unknown stereotypes take no part in identity checks.
    EXPECT_EQ(problems.size(), 3u);
}

TEST(StructuralValidatorTest, IdentityIntervals) {
    ModelBuilder b("identity");
    const auto person = b.add_class("person", "Person", "kind");
    const auto dog = b.add_class("dog", "Dog", "kind");
    const auto man = b.add_class("man", "Man", "subkind");
    const auto woman = b.add_class("woman", "Woman", "subkind");
    const auto hybrid = b.add_class("hybrid", "Hybrid", "subkind");
    const auto orphan = b.add_class("orphan", "Orphan", "subkind");
    const auto named = b.add_class("named", "Named", "category", true);
    const auto child = b.add_class("child", "Child", "phase");
    const auto grown = b.add_class("grown", "Grown", "phase");
    b.add_generalization("gender", {man, woman}, {person}, true, true);
    b.add_generalization("hybrid-g", {hybrid}, {person, dog});
    b.add_generalization("named-g", {person}, {named});
    b.add_generalization("age", {child, grown}, {person}, false, true);
    const auto model = b.build();

    const ClassifierGraph graph(model);
    StructuralValidator validator(graph);
    const auto problems = validator.run();

    const auto interval = [&](ElementId id) { return *validator.identity_interval(id); };
    EXPECT_TRUE(interval(person).is_exactly_one());
    EXPECT_TRUE(interval(man).is_exactly_one());
    EXPECT_TRUE(interval(woman).is_exactly_one());
    EXPECT_TRUE(interval(child).is_exactly_one());
    EXPECT_EQ(interval(hybrid).min, 0u);
    EXPECT_EQ(interval(hybrid).max, 3u);
    EXPECT_EQ(interval(orphan).max, 0u);
    EXPECT_EQ(interval(named).max, 0u);

    for (ElementId id : graph.classes()) {
        const auto s = graph.stereotype_of(id);
        ASSERT_TRUE(s);
        if (!requires_identity(*s)) {
            EXPECT_EQ(count_errors(problems, ErrorKind::InvalidIdentity, id), 0u);
            continue;
        }
        const bool exact = interval(id).is_exactly_one();
        EXPECT_EQ(count_errors(problems, ErrorKind::InvalidIdentity, id), exact ? 0u : 1u)
            << model.uuid_of(id);
    }
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidIdentity), 2u);
}

TEST(StructuralValidatorTest, MultiplicitiesMustParseAndBeConsistent) {
    ModelBuilder b("mult");
    const auto a = b.add_class("a", "A", "kind");
    const auto c = b.add_class("c", "C", "kind");
    const auto missing = b.add_association("missing", "", a, "", c, "1");
    const auto garbage = b.add_association("garbage", "formal", a, "1", c, "lots");
    const auto inverted = b.add_association("inverted", "", a, "3..1", c, "0..*");
    const auto fine = b.add_association("fine", "", a, "*", c, "1..*");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, missing), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, garbage), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, inverted), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, fine), 0u);
    EXPECT_EQ(problems.size(), 3u);
}

TEST(StructuralValidatorTest, RelatorNeedsTwoMediatedIndividuals) {
    ModelBuilder b("enrollment");
    const auto person = b.add_class("person", "Person", "kind");
    const auto student = b.add_class("student", "Student", "role");
    const auto university = b.add_class("university", "University", "kind");
    const auto enrollment = b.add_class("enrollment", "Enrollment", "relator");
    b.add_generalization("g", {student}, {person});
    b.add_association("m1", "mediation", enrollment, "1..*", student, "1");

    ModelBuilder complete = b;
    complete.add_association("m2", "mediation", enrollment, "0..*", university, "1..1");

    const auto single = check(b.build());
    EXPECT_EQ(count_errors(single, ErrorKind::InvalidRelator, enrollment), 1u);
    EXPECT_EQ(count_errors(single, ErrorKind::InvalidRole, student), 0u);
    EXPECT_EQ(count_errors(single, ErrorKind::InvalidRelationMultiplicities), 0u);

    const auto both = check(complete.build());
    EXPECT_EQ(count_errors(both, ErrorKind::InvalidRelator), 0u);
    // "0..*" on the relator end of m2 violates the mediation shape.
    EXPECT_EQ(count_errors(both, ErrorKind::InvalidRelationMultiplicities), 1u);
    EXPECT_EQ(both.size(), 1u);
}

TEST(StructuralValidatorTest, AbstractRelatorAndSubtypedRelator) {
    ModelBuilder b("relators");
    const auto bond = b.add_class("bond", "Bond", "relator", true);
    const auto contract = b.add_class("contract", "Contract", "subkind");
    b.add_generalization("g", {contract}, {bond});

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelator, bond), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelator, contract), 1u);
}

TEST(StructuralValidatorTest, RoleInheritsMediationFromParentRole) {
    ModelBuilder b("roles");
    const auto person = b.add_class("person", "Person", "kind");
    const auto student = b.add_class("student", "Student", "role");
    const auto graduate = b.add_class("graduate", "Graduate", "role");
    const auto enrollment = b.add_class("enrollment", "Enrollment", "relator");
    b.add_generalization("g1", {student}, {person});
    b.add_generalization("g2", {graduate}, {student});
    b.add_association("m", "mediation", enrollment, "1..*", student, "2..*");
    const auto model = b.build();

    const ClassifierGraph graph(model);
    StructuralValidator validator(graph);
    const auto problems = validator.run();
    EXPECT_EQ(validator.mediated_lower_bound(graduate), 1u);
    EXPECT_EQ(validator.mediated_lower_bound(enrollment), 2u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRole), 0u);
    EXPECT_TRUE(problems.empty());
}

TEST(StructuralValidatorTest, PhaseMustBelongToDisjointCompleteSet) {
    ModelBuilder b("phases");
    const auto person = b.add_class("person", "Person", "kind");
    const auto child = b.add_class("child", "Child", "phase");
    const auto adult = b.add_class("adult", "Adult", "phase");
    const auto lonely = b.add_class("lonely", "Lonely", "phase");
    b.add_generalization("age", {child, adult}, {person}, true, true);
    b.add_generalization("mood", {lonely}, {person}, true, false);

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidPhase, child), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidPhase, adult), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidPhase, lonely), 1u);
    EXPECT_EQ(problems.size(), 1u);
}

TEST(StructuralValidatorTest, MixinsMustBeAbstract) {
    ModelBuilder b("mixins");
    const auto concrete = b.add_class("concrete", "Insurable", "category");
    const auto abstract = b.add_class("abstract", "Seatable", "mixin", true);
    const auto role_mixin = b.add_class("rm", "Customer", "roleMixin");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidNonabstractMixin, concrete), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidNonabstractMixin, abstract), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidNonabstractMixin, role_mixin), 1u);
    EXPECT_EQ(problems.size(), 2u);
}

TEST(StructuralValidatorTest, AspectsNeedCharacterization) {
    ModelBuilder b("aspects");
    const auto apple = b.add_class("apple", "Apple", "kind");
    const auto color = b.add_class("color", "Color", "quality");
    const auto skill = b.add_class("skill", "Skill", "mode");
    const auto c = b.add_association("c", "characterization", apple, "1..1", color, "1");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidMissingCharacterization, color), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidMissingCharacterization, skill), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, c), 0u);
    EXPECT_EQ(problems.size(), 1u);
}

TEST(StructuralValidatorTest, CharacterizationShapeAndEndpoints) {
    ModelBuilder b("characterization");
    const auto apple = b.add_class("apple", "Apple", "kind");
    const auto pear = b.add_class("pear", "Pear", "kind");
    const auto bad = b.add_association("bad", "characterization", apple, "0..1", pear, "1");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, bad), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, bad), 1u);
    EXPECT_EQ(problems.size(), 2u);
}

TEST(StructuralValidatorTest, PartWholeRelations) {
    ModelBuilder b("parts");
    const auto crowd = b.add_class("crowd", "Crowd", "collective");
    const auto group = b.add_class("group", "Group", "collective");
    const auto person = b.add_class("person", "Person", "kind");
    const auto wine = b.add_class("wine", "Wine", "quantity");
    const auto alcohol = b.add_class("alcohol", "Alcohol", "quantity");
    const auto member = b.add_association("member", "memberOf", crowd, "*", person, "1..*");
    const auto sub = b.add_association("sub", "subcollectionOf", crowd, "0..1", group, "1");
    const auto quantity = b.add_association("quantity", "subquantityOf", wine, "1", alcohol, "1..1");
    const auto wrong_whole = b.add_association("wrong-whole", "memberOf", person, "*", crowd, "1..*");
    const auto wrong_shape = b.add_association("wrong-shape", "subquantityOf", wine, "0..1", alcohol, "1");
    const auto component = b.add_association("component", "componentOf", person, "1", wine, "1");

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, member), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, sub), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, sub), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, quantity), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, quantity), 0u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, wrong_whole), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationMultiplicities, wrong_shape), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelationEndpoints, component), 1u);
}

TEST(StructuralValidatorTest, DanglingReferencesBecomeDiagnostics) {
    ModelBuilder b("dangling");
    const auto kind = b.add_class("kind", "Thing", "kind");
    const auto note = b.add_comment("note", "not a class");
    const auto g = b.add_generalization("g", {kind}, {ontouml_model::invalid_element});
    const auto a = b.add_association("a", "", kind, "1", note, "1");
    const auto empty = b.add_generalization("empty", {}, {kind});

    const auto problems = check(b.build());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidReference, g), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidReference, a), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidReference, empty), 1u);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidIdentity), 0u);
}

TEST(StructuralValidatorTest, InstanceEndsAreOpaque) {
    ModelBuilder b("instances");
    const auto kind = b.add_class("kind", "Person", "kind");
    const auto john = b.add_instance("john", "john", "Person");
    b.add_association("a", "memberOf", john, "1", kind, "1");

    EXPECT_TRUE(check(b.build()).empty());
}

TEST(StructuralValidatorTest, ErrorsFollowTraversalOrder) {
    ModelBuilder b("order");
    const auto pkg = b.add_package("pkg", "Pkg");
    const auto x = b.add_class("x", "X", "bogus", false, {}, pkg);
    const auto kind = b.add_class("kind", "K", "kind");
    const auto sub = b.add_class("sub", "S", "subkind");
    const auto g = b.add_generalization("g", {kind}, {sub});
    const auto a = b.add_association("a", "", kind, "", sub, "1");

    const auto problems = check(b.build());
    ASSERT_GE(problems.size(), 4u);
    EXPECT_EQ(problem_element(problems[0]), x);
    EXPECT_EQ(problem_element(problems[1]), g);
    EXPECT_EQ(problem_element(problems[2]), a);
    EXPECT_EQ(std::get<ErrorProblem>(problems[3]).kind, ErrorKind::InvalidIdentity);
}

TEST(StructuralValidatorTest, RepeatedGeneralizationEndsCountOnce) {
    ModelBuilder b("repeated");
    const auto kind = b.add_class("kind", "Person", "kind");
    const auto sub = b.add_class("sub", "Adult", "subkind");
    const auto other = b.add_class("other", "Minor", "subkind");
    b.add_generalization("g", {sub, sub}, {kind, kind}, true, true);
    b.add_generalization("h", {other}, {kind, kind});
    const auto model = b.build();

    const ClassifierGraph graph(model);
    StructuralValidator validator(graph);
    const auto problems = validator.run();
    EXPECT_TRUE(validator.identity_interval(sub)->is_exactly_one());
    EXPECT_TRUE(validator.identity_interval(other)->is_exactly_one());
    EXPECT_TRUE(problems.empty());
}

TEST(StructuralValidatorTest, MediationBoundsSaturate) {
    ModelBuilder b("huge");
    const auto x = b.add_class("x", "X", "kind");
    const auto y = b.add_class("y", "Y", "kind");
    const auto r = b.add_class("r", "R", "relator");
    b.add_association("mx", "mediation", r, "1", x, "18446744073709551615");
    b.add_association("my", "mediation", r, "1", y, "1");
    const auto model = b.build();

    const ClassifierGraph graph(model);
    StructuralValidator validator(graph);
    const auto problems = validator.run();
    EXPECT_EQ(validator.mediated_lower_bound(r), std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRelator), 0u);
    EXPECT_TRUE(problems.empty());
}

TEST(StructuralValidatorTest, MediationSumsThroughStackedDiamonds) {
    ModelBuilder b("diamonds");
    const auto person = b.add_class("person", "Person", "kind");
    const auto student = b.add_class("student", "Student", "role");
    const auto enrollment = b.add_class("enrollment", "Enrollment", "relator");
    b.add_generalization("g", {student}, {person});
    b.add_association("m", "mediation", enrollment, "1", student, "2");
    ElementId prev = student;
    for (int i = 0; i < 30; ++i) {
        const std::string n = std::to_string(i);
        const auto l = b.add_class("l" + n, "L" + n, "role");
        const auto r = b.add_class("r" + n, "R" + n, "role");
        const auto j = b.add_class("j" + n, "J" + n, "role");
        b.add_generalization("gl" + n, {l}, {prev});
        b.add_generalization("gr" + n, {r}, {prev});
        b.add_generalization("gj" + n, {j}, {l, r});
        prev = j;
    }
    const auto model = b.build();

    const ClassifierGraph graph(model);
    StructuralValidator validator(graph);
    const auto problems = validator.run();
    // Each overlapping two-parent level doubles the inherited bound.
    EXPECT_EQ(validator.mediated_lower_bound(prev), std::uint64_t{1} << 30);
    EXPECT_EQ(count_errors(problems, ErrorKind::InvalidRole), 0u);
}
