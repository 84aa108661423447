#include <ontouml_loaders/example_model.hpp>
#include <ontouml_model/model_builder.hpp>

namespace ontouml_loaders {

ontouml_model::Model generate_example_model() {
    ontouml_model::ModelBuilder b("Demo OntoUML diagram", "demo");

    const auto animal = b.add_class("animal", "Animal", "kind");
    const auto human = b.add_class("human", "Human", "subkind");
    const auto alive = b.add_class("alive", "Alive", "phase");
    const auto dead = b.add_class("dead", "Dead", "phase");
    const auto marriage = b.add_class("marriage", "Marriage", "relator");

    b.add_generalization("gen-phase", {alive, dead}, {animal}, true, true);
    b.add_generalization("gen-human", {human}, {animal});
    b.add_association("mediation", "mediation", human, "2..*", marriage, "1..1");

    const auto note = b.add_comment("note", "Alive and Dead partition every Animal.");
    b.add_comment_link("note-link", note, animal);

    return b.build();
}

} // namespace ontouml_loaders
