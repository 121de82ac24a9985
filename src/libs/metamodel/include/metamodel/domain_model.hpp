#pragma once

#include <metamodel/aggregates.hpp>
#include <metamodel/class.hpp>
#include <metamodel/relationships.hpp>
#include <metamodel/types.hpp>
#include <string>
#include <vector>

namespace metamodel {

class Model : public NamedElement {
public:
    using NamedElement::NamedElement;
};

// Root of a structural model. Holds (does not own) the model's elements; each
// collection setter validates the complete candidate and either replaces the
// stored collection or throws leaving it as it was.
class DomainModel : public Model {
public:
    explicit DomainModel(std::string name, ElementSet<Type> types = {},
        ElementSet<Association> associations = {}, ElementSet<Generalization> generalizations = {},
        ElementSet<Package> packages = {}, ElementSet<Constraint> constraints = {},
        Synonyms synonyms = std::nullopt);

    // Always contains the eight primitive types.
    const ElementSet<Type>& types() const { return types_; }
    void set_types(ElementSet<Type> types);
    void add_type(Type& type);

    const ElementSet<Association>& associations() const { return associations_; }
    void set_associations(ElementSet<Association> associations);
    void add_association(Association& association);

    const ElementSet<Generalization>& generalizations() const { return generalizations_; }
    void set_generalizations(ElementSet<Generalization> generalizations);
    void add_generalization(Generalization& generalization);

    // Named groupings over the model's generalizations, unique by name.
    const ElementSet<GeneralizationSet>& generalization_sets() const { return generalization_sets_; }
    void set_generalization_sets(ElementSet<GeneralizationSet> generalization_sets);
    void add_generalization_set(GeneralizationSet& generalization_set);

    const ElementSet<Package>& packages() const { return packages_; }
    void set_packages(ElementSet<Package> packages);
    void add_package(Package& package);

    const ElementSet<Constraint>& constraints() const { return constraints_; }
    void set_constraints(ElementSet<Constraint> constraints);
    void add_constraint(Constraint& constraint);

    Type* get_type_by_name(const std::string& name) const;
    Class* get_class_by_name(const std::string& name) const;
    Association* get_association_by_name(const std::string& name) const;
    ElementSet<Class> get_classes() const;
    ElementSet<Enumeration> get_enumerations() const;

    // Every class of the model, each parent before all of its descendants.
    // Throws CyclicGeneralization if the classes' generalizations form a cycle.
    std::vector<Class*> classes_sorted_by_inheritance() const;

private:
    ElementSet<Type> types_;
    ElementSet<Association> associations_;
    ElementSet<Generalization> generalizations_;
    ElementSet<GeneralizationSet> generalization_sets_;
    ElementSet<Package> packages_;
    ElementSet<Constraint> constraints_;
};

} // namespace metamodel
