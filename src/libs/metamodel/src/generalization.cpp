#include <metamodel/relationships.hpp>
#include "validation.hpp"

namespace metamodel {

namespace {

void check_class(const Class* cls, const char* role) {
    if (!cls) reject<InvalidValue>(std::string("Generalization needs a ") + role + " class.");
}

} // namespace

Generalization::Generalization(Class* general, Class* specific) {
    check_class(general, "general");
    check_class(specific, "specific");
    if (general == specific)
        reject<SelfGeneralization>("A class cannot be a generalization of itself: '"
            + general->name() + "'.");
    set_general(general);
    set_specific(specific);
}

void Generalization::set_general(Class* general) {
    check_class(general, "general");
    if (general == specific_)
        reject<SelfGeneralization>("A class cannot be a generalization of itself: '"
            + general->name() + "'.");
    if (general_) general_->unlink_generalization(this);
    general->link_generalization(this);
    logger()->debug("generalization general: '{}' -> '{}'",
        general_ ? general_->name() : std::string("-"), general->name());
    general_ = general;
}

void Generalization::set_specific(Class* specific) {
    check_class(specific, "specific");
    if (specific == general_)
        reject<SelfGeneralization>("A class cannot be a generalization of itself: '"
            + specific->name() + "'.");
    if (specific_) specific_->unlink_generalization(this);
    specific->link_generalization(this);
    logger()->debug("generalization specific: '{}' -> '{}'",
        specific_ ? specific_->name() : std::string("-"), specific->name());
    specific_ = specific;
}

} // namespace metamodel
