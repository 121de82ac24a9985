#include <metamodel/domain_model.hpp>
#include <metamodel/primitive_types.hpp>
#include "validation.hpp"
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace metamodel {

namespace {

template <typename T>
void check_unique_names(const ElementSet<T>& elements, const std::string& model, const char* what) {
    auto duplicates = duplicate_names(elements);
    if (!duplicates.empty())
        reject<DuplicateName>("The model '" + model + "' cannot have " + what
            + " with duplicate names: " + join_names(duplicates) + ".");
}

using ChildMap = std::unordered_map<const Class*, std::vector<Class*>>;

// Post-order walk over the direct-children map. `visited` is shared by every
// root so each class is appended once; `on_path` detects cycles.
struct InheritanceWalk {
    const ChildMap& children;
    std::unordered_set<const Class*> visited;
    std::unordered_set<const Class*> on_path;
    std::vector<Class*> sorted;

    void visit(Class* cls) {
        visited.insert(cls);
        on_path.insert(cls);
        auto it = children.find(cls);
        if (it != children.end()) {
            for (Class* child : it->second) {
                if (on_path.count(child))
                    reject<CyclicGeneralization>("Generalization cycle between '" + cls->name()
                        + "' and '" + child->name() + "'.");
                if (!visited.count(child)) visit(child);
            }
        }
        on_path.erase(cls);
        sorted.push_back(cls);
    }
};

} // namespace

DomainModel::DomainModel(std::string name, ElementSet<Type> types,
    ElementSet<Association> associations, ElementSet<Generalization> generalizations,
    ElementSet<Package> packages, ElementSet<Constraint> constraints, Synonyms synonyms)
    : Model(std::move(name), std::move(synonyms)) {
    set_types(std::move(types));
    set_packages(std::move(packages));
    set_constraints(std::move(constraints));
    set_associations(std::move(associations));
    set_generalizations(std::move(generalizations));
}

void DomainModel::set_types(ElementSet<Type> types) {
    reject_null_members(types, "Model '" + name() + "'");
    types.insert(primitive_types().begin(), primitive_types().end());
    check_unique_names(types, name(), "types");
    types_ = std::move(types);
}

void DomainModel::add_type(Type& type) {
    auto candidate = types_;
    candidate.insert(&type);
    set_types(std::move(candidate));
}

void DomainModel::set_associations(ElementSet<Association> associations) {
    reject_null_members(associations, "Model '" + name() + "'");
    check_unique_names(associations, name(), "associations");
    associations_ = std::move(associations);
}

void DomainModel::add_association(Association& association) {
    auto candidate = associations_;
    candidate.insert(&association);
    set_associations(std::move(candidate));
}

void DomainModel::set_generalizations(ElementSet<Generalization> generalizations) {
    reject_null_members(generalizations, "Model '" + name() + "'");
    generalizations_ = std::move(generalizations);
}

void DomainModel::add_generalization(Generalization& generalization) {
    auto candidate = generalizations_;
    candidate.insert(&generalization);
    set_generalizations(std::move(candidate));
}

void DomainModel::set_generalization_sets(ElementSet<GeneralizationSet> generalization_sets) {
    reject_null_members(generalization_sets, "Model '" + name() + "'");
    check_unique_names(generalization_sets, name(), "generalization sets");
    generalization_sets_ = std::move(generalization_sets);
}

void DomainModel::add_generalization_set(GeneralizationSet& generalization_set) {
    auto candidate = generalization_sets_;
    candidate.insert(&generalization_set);
    set_generalization_sets(std::move(candidate));
}

void DomainModel::set_packages(ElementSet<Package> packages) {
    reject_null_members(packages, "Model '" + name() + "'");
    check_unique_names(packages, name(), "packages");
    packages_ = std::move(packages);
}

void DomainModel::add_package(Package& package) {
    auto candidate = packages_;
    candidate.insert(&package);
    set_packages(std::move(candidate));
}

void DomainModel::set_constraints(ElementSet<Constraint> constraints) {
    reject_null_members(constraints, "Model '" + name() + "'");
    check_unique_names(constraints, name(), "constraints");
    constraints_ = std::move(constraints);
}

void DomainModel::add_constraint(Constraint& constraint) {
    auto candidate = constraints_;
    candidate.insert(&constraint);
    set_constraints(std::move(candidate));
}

Type* DomainModel::get_type_by_name(const std::string& name) const {
    for (Type* type : types_)
        if (type->name() == name) return type;
    return nullptr;
}

Class* DomainModel::get_class_by_name(const std::string& name) const {
    for (Type* type : types_) {
        auto* cls = dynamic_cast<Class*>(type);
        if (cls && cls->name() == name) return cls;
    }
    return nullptr;
}

Association* DomainModel::get_association_by_name(const std::string& name) const {
    for (Association* association : associations_)
        if (association->name() == name) return association;
    return nullptr;
}

ElementSet<Class> DomainModel::get_classes() const {
    ElementSet<Class> out;
    for (Type* type : types_)
        if (auto* cls = dynamic_cast<Class*>(type)) out.insert(cls);
    return out;
}

ElementSet<Enumeration> DomainModel::get_enumerations() const {
    ElementSet<Enumeration> out;
    for (Type* type : types_)
        if (auto* enumeration = dynamic_cast<Enumeration*>(type)) out.insert(enumeration);
    return out;
}

std::vector<Class*> DomainModel::classes_sorted_by_inheritance() const {
    const ElementSet<Class> classes = get_classes();

    // Generalizations reaching classes outside the model are ignored.
    ChildMap children;
    for (Class* cls : classes) {
        for (const Generalization* generalization : cls->generalizations()) {
            if (generalization->specific() != cls || !classes.count(generalization->general()))
                continue;
            children[generalization->general()].push_back(cls);
        }
    }

    InheritanceWalk walk{children, {}, {}, {}};
    for (Class* cls : classes)
        if (!walk.visited.count(cls)) walk.visit(cls);

    std::vector<Class*> sorted(walk.sorted.rbegin(), walk.sorted.rend());
    logger()->trace("model '{}': {} classes sorted by inheritance", name(), sorted.size());
    return sorted;
}

} // namespace metamodel
