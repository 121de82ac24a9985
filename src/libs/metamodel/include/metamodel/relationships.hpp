#pragma once

#include <metamodel/class.hpp>
#include <metamodel/members.hpp>
#include <string>

namespace metamodel {

// Links two or more class-typed ends. Each end is owned by the association and
// each end's class lists the association among its back-references.
class Association : public NamedElement {
public:
    Association(std::string name, ElementSet<Property> ends, Synonyms synonyms = std::nullopt);

    const ElementSet<Property>& ends() const { return ends_; }
    // Validates the whole candidate, detaches the association from the old
    // ends' classes, then attaches it to the new ones.
    void set_ends(ElementSet<Property> ends);

    // First end typed by `cls`, or null.
    Property* end_for(const Class* cls) const;
    // For a binary association, the end that is not `end`.
    Property* opposite_end(const Property* end) const;

protected:
    // For subclasses that install their ends from their own constructor.
    Association(std::string name, Synonyms synonyms);

    virtual void check_ends(const ElementSet<Property>& ends) const;

private:
    friend class Property;

    void end_retyped(Class* old_class);

    ElementSet<Property> ends_;
};

class BinaryAssociation : public Association {
public:
    BinaryAssociation(std::string name, ElementSet<Property> ends, Synonyms synonyms = std::nullopt);

protected:
    // Exactly two ends, not both composite.
    void check_ends(const ElementSet<Property>& ends) const override;
};

// A parent/child edge between two classes. Each setter keeps both classes'
// generalization back-references in step on its own.
class Generalization : public Element {
public:
    Generalization(Class* general, Class* specific);

    Class* general() const { return general_; }
    Class* specific() const { return specific_; }

    void set_general(Class* general);
    void set_specific(Class* specific);

private:
    Class* general_ = nullptr;
    Class* specific_ = nullptr;
};

} // namespace metamodel
