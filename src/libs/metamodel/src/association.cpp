#include <metamodel/relationships.hpp>
#include "validation.hpp"
#include <utility>

namespace metamodel {

Association::Association(std::string name, ElementSet<Property> ends, Synonyms synonyms)
    : Association(std::move(name), std::move(synonyms)) {
    set_ends(std::move(ends));
}

Association::Association(std::string name, Synonyms synonyms)
    : NamedElement(std::move(name), std::move(synonyms)) {}

void Association::check_ends(const ElementSet<Property>& ends) const {
    if (ends.size() <= 1)
        reject<ArityViolation>("Association '" + name() + "' must have more than one end.");
}

void Association::set_ends(ElementSet<Property> ends) {
    reject_null_members(ends, "Association '" + name() + "'");
    check_ends(ends);
    for (const Property* end : ends) {
        if (!dynamic_cast<const Class*>(end->type()))
            reject<InvalidValue>("Association end '" + end->name() + "' of '" + name()
                + "' must be typed by a class, not '" + end->type()->name() + "'.");
    }

    for (Property* end : ends_)
        if (auto* cls = dynamic_cast<Class*>(end->type())) cls->unlink_association(this);
    for (Property* end : ends) {
        end->set_owner(this);
        static_cast<Class*>(end->type())->link_association(this);
    }
    logger()->debug("association '{}' rewired: {} -> {} ends", name(), ends_.size(), ends.size());
    ends_ = std::move(ends);
}

Property* Association::end_for(const Class* cls) const {
    for (Property* end : ends_)
        if (end->type() == cls) return end;
    return nullptr;
}

Property* Association::opposite_end(const Property* end) const {
    if (ends_.size() != 2) return nullptr;
    Property* first = *ends_.begin();
    Property* second = *ends_.rbegin();
    if (end == first) return second;
    if (end == second) return first;
    return nullptr;
}

void Association::end_retyped(Class* old_class) {
    if (old_class && !end_for(old_class)) old_class->unlink_association(this);
    for (Property* end : ends_)
        if (auto* cls = dynamic_cast<Class*>(end->type())) cls->link_association(this);
    logger()->debug("association '{}' end retyped from '{}'", name(),
        old_class ? old_class->name() : std::string("?"));
}

BinaryAssociation::BinaryAssociation(std::string name, ElementSet<Property> ends, Synonyms synonyms)
    : Association(std::move(name), std::move(synonyms)) {
    set_ends(std::move(ends));
}

void BinaryAssociation::check_ends(const ElementSet<Property>& ends) const {
    if (ends.size() != 2)
        reject<ArityViolation>("Binary association '" + name() + "' must have exactly two ends, got "
            + std::to_string(ends.size()) + ".");
    if ((*ends.begin())->is_composite() && (*ends.rbegin())->is_composite())
        reject<ArityViolation>("Binary association '" + name()
            + "' cannot tag the composition at both ends.");
}

} // namespace metamodel
