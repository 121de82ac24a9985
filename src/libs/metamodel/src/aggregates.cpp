#include <metamodel/aggregates.hpp>
#include "validation.hpp"
#include <utility>

namespace metamodel {

GeneralizationSet::GeneralizationSet(std::string name, ElementSet<Generalization> generalizations,
    bool is_disjoint, bool is_complete, Synonyms synonyms)
    : NamedElement(std::move(name), std::move(synonyms)),
      is_disjoint_(is_disjoint),
      is_complete_(is_complete) {
    set_generalizations(std::move(generalizations));
}

void GeneralizationSet::set_generalizations(ElementSet<Generalization> generalizations) {
    reject_null_members(generalizations, "Generalization set '" + name() + "'");
    generalizations_ = std::move(generalizations);
}

Package::Package(std::string name, ElementSet<Class> classes, Synonyms synonyms)
    : NamedElement(std::move(name), std::move(synonyms)) {
    set_classes(std::move(classes));
}

void Package::set_classes(ElementSet<Class> classes) {
    reject_null_members(classes, "Package '" + name() + "'");
    auto duplicates = duplicate_names(classes);
    if (!duplicates.empty())
        reject<DuplicateName>("Package '" + name() + "' cannot have classes with duplicate names: "
            + join_names(duplicates) + ".");
    classes_ = std::move(classes);
}

void Package::add_class(Class& cls) {
    if (classes_.count(&cls)) return;
    for (const Class* existing : classes_)
        if (existing->name() == cls.name())
            reject<DuplicateName>("Package '" + name() + "' already has a class named '"
                + cls.name() + "'.");
    classes_.insert(&cls);
}

Constraint::Constraint(std::string name, Class* context, std::string expression,
    std::string language, Synonyms synonyms)
    : NamedElement(std::move(name), std::move(synonyms)),
      expression_(std::move(expression)),
      language_(std::move(language)) {
    set_context(context);
}

void Constraint::set_context(Class* context) {
    if (!context) reject<InvalidValue>("Constraint '" + name() + "' needs a context class.");
    context_ = context;
}

} // namespace metamodel
