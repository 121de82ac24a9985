#pragma once

#include <metamodel/members.hpp>
#include <metamodel/types.hpp>
#include <string>

namespace metamodel {

class Association;
class Generalization;

class Class : public Type {
public:
    explicit Class(std::string name, ElementSet<Property> attributes = {},
        ElementSet<Method> methods = {}, bool is_abstract = false, bool is_read_only = false,
        Synonyms synonyms = std::nullopt);

    const ElementSet<Property>& attributes() const { return attributes_; }
    // Replaces every attribute. Attributes left out keep their owner.
    void set_attributes(ElementSet<Property> attributes);
    void add_attribute(Property& attribute);
    Property* attribute(const std::string& name) const;

    const ElementSet<Method>& methods() const { return methods_; }
    void set_methods(ElementSet<Method> methods);
    void add_method(Method& method);
    Method* method(const std::string& name) const;

    bool is_abstract() const { return is_abstract_; }
    void set_abstract(bool value) { is_abstract_ = value; }
    bool is_read_only() const { return is_read_only_; }
    void set_read_only(bool value) { is_read_only_ = value; }

    // Back-references, maintained by Association and Generalization.
    const ElementSet<Association>& associations() const { return associations_; }
    const ElementSet<Generalization>& generalizations() const { return generalizations_; }

    Property* id_attribute() const;

    // Own attributes plus those of every ancestor. Same-named attributes of
    // different classes all appear.
    ElementSet<Property> all_attributes() const;
    ElementSet<Property> inherited_attributes() const;

    // Ends of this class's associations that lead to other classes. For a
    // binary self-association both ends are returned.
    ElementSet<Property> association_ends() const;
    ElementSet<Property> all_association_ends() const;

    ElementSet<Class> parents() const;
    // Throws CyclicGeneralization if the class is its own ancestor.
    ElementSet<Class> all_parents() const;
    ElementSet<Class> specializations() const;
    ElementSet<Class> all_specializations() const;

private:
    friend class Association;
    friend class Generalization;

    void link_association(Association* association);
    void unlink_association(Association* association);
    void link_generalization(Generalization* generalization);
    void unlink_generalization(Generalization* generalization);

    ElementSet<Property> attributes_;
    ElementSet<Method> methods_;
    bool is_abstract_ = false;
    bool is_read_only_ = false;
    ElementSet<Association> associations_;
    ElementSet<Generalization> generalizations_;
};

// A class that carries the attributes of an association.
class AssociationClass : public Class {
public:
    AssociationClass(std::string name, ElementSet<Property> attributes, Association* association,
        Synonyms synonyms = std::nullopt);

    Association* association() const { return association_; }
    void set_association(Association* association);

private:
    Association* association_ = nullptr;
};

} // namespace metamodel
