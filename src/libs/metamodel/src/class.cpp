#include <metamodel/class.hpp>
#include <metamodel/relationships.hpp>
#include "validation.hpp"
#include <iterator>
#include <unordered_set>
#include <utility>

namespace metamodel {

namespace {

// Depth-first closure over one generalization direction. `path` holds the
// classes on the current branch; meeting one of them again is a cycle.
template <typename Step>
void close_over(const Class* cls, Step step, ElementSet<Class>& out,
    std::unordered_set<const Class*>& path)
{
    path.insert(cls);
    for (Class* next : step(cls)) {
        if (path.count(next))
            reject<CyclicGeneralization>("Generalization cycle through class '" + next->name() + "'.");
        if (out.insert(next).second)
            close_over(next, step, out, path);
    }
    path.erase(cls);
}

// A property that is still an end of its association cannot become an attribute.
void check_not_association_end(Property* attribute, const std::string& cls) {
    auto* association = dynamic_cast<const Association*>(attribute->owner());
    if (association && association->ends().count(attribute))
        reject<InvalidOwner>("'" + attribute->name() + "' is an end of association '"
            + association->name() + "' and cannot be an attribute of class '" + cls + "'.");
}

std::size_t count_ids(const ElementSet<Property>& attributes) {
    std::size_t ids = 0;
    for (const Property* attribute : attributes)
        if (attribute->is_id()) ++ids;
    return ids;
}

} // namespace

Class::Class(std::string name, ElementSet<Property> attributes, ElementSet<Method> methods,
    bool is_abstract, bool is_read_only, Synonyms synonyms)
    : Type(std::move(name), std::move(synonyms)),
      is_abstract_(is_abstract),
      is_read_only_(is_read_only) {
    set_attributes(std::move(attributes));
    set_methods(std::move(methods));
}

void Class::set_attributes(ElementSet<Property> attributes) {
    reject_null_members(attributes, "Class '" + name() + "'");
    auto duplicates = duplicate_names(attributes);
    if (!duplicates.empty())
        reject<DuplicateName>("A class cannot have attributes with duplicate names: "
            + join_names(duplicates) + ".");
    if (count_ids(attributes) > 1)
        reject<MultipleIdentifiers>("Class '" + name()
            + "' cannot have more than one attribute marked as 'id'.");
    for (Property* attribute : attributes)
        check_not_association_end(attribute, name());
    for (Property* attribute : attributes)
        attribute->set_owner(this);
    attributes_ = std::move(attributes);
}

void Class::add_attribute(Property& attribute) {
    if (this->attribute(attribute.name()))
        reject<DuplicateName>("A class cannot have two attributes with the same name: '"
            + attribute.name() + "'.");
    if (attribute.is_id() && id_attribute())
        reject<MultipleIdentifiers>("Class '" + name() + "' already has id attribute '"
            + id_attribute()->name() + "'.");
    check_not_association_end(&attribute, name());
    attribute.set_owner(this);
    attributes_.insert(&attribute);
}

Property* Class::attribute(const std::string& name) const {
    for (Property* attribute : attributes_)
        if (attribute->name() == name) return attribute;
    return nullptr;
}

void Class::set_methods(ElementSet<Method> methods) {
    reject_null_members(methods, "Class '" + name() + "'");
    auto duplicates = duplicate_names(methods);
    if (!duplicates.empty())
        reject<DuplicateName>("A class cannot have methods with duplicate names: "
            + join_names(duplicates) + ".");
    for (Method* method : methods)
        method->set_owner(this);
    methods_ = std::move(methods);
}

void Class::add_method(Method& method) {
    if (this->method(method.name()))
        reject<DuplicateName>("A class cannot have two methods with the same name: '"
            + method.name() + "'.");
    method.set_owner(this);
    methods_.insert(&method);
}

Method* Class::method(const std::string& name) const {
    for (Method* method : methods_)
        if (method->name() == name) return method;
    return nullptr;
}

Property* Class::id_attribute() const {
    for (Property* attribute : attributes_)
        if (attribute->is_id()) return attribute;
    return nullptr;
}

ElementSet<Property> Class::all_attributes() const {
    ElementSet<Property> out = inherited_attributes();
    out.insert(attributes_.begin(), attributes_.end());
    return out;
}

ElementSet<Property> Class::inherited_attributes() const {
    ElementSet<Property> out;
    for (const Class* parent : all_parents())
        out.insert(parent->attributes_.begin(), parent->attributes_.end());
    return out;
}

ElementSet<Property> Class::association_ends() const {
    ElementSet<Property> out;
    for (const Association* association : associations_) {
        const auto& ends = association->ends();
        const bool self_association = ends.size() == 2
            && (*ends.begin())->type() == (*std::next(ends.begin()))->type();
        for (Property* end : ends)
            if (self_association || end->type() != this) out.insert(end);
    }
    return out;
}

ElementSet<Property> Class::all_association_ends() const {
    ElementSet<Property> out = association_ends();
    for (const Class* parent : all_parents()) {
        auto ends = parent->association_ends();
        out.insert(ends.begin(), ends.end());
    }
    return out;
}

ElementSet<Class> Class::parents() const {
    ElementSet<Class> out;
    for (const Generalization* generalization : generalizations_)
        if (generalization->general() != this) out.insert(generalization->general());
    return out;
}

ElementSet<Class> Class::all_parents() const {
    ElementSet<Class> out;
    std::unordered_set<const Class*> path;
    close_over(this, [](const Class* c) { return c->parents(); }, out, path);
    logger()->trace("class '{}' has {} ancestors", name(), out.size());
    return out;
}

ElementSet<Class> Class::specializations() const {
    ElementSet<Class> out;
    for (const Generalization* generalization : generalizations_)
        if (generalization->specific() != this) out.insert(generalization->specific());
    return out;
}

ElementSet<Class> Class::all_specializations() const {
    ElementSet<Class> out;
    std::unordered_set<const Class*> path;
    close_over(this, [](const Class* c) { return c->specializations(); }, out, path);
    return out;
}

void Class::link_association(Association* association) {
    associations_.insert(association);
}

void Class::unlink_association(Association* association) {
    associations_.erase(association);
}

void Class::link_generalization(Generalization* generalization) {
    generalizations_.insert(generalization);
}

void Class::unlink_generalization(Generalization* generalization) {
    generalizations_.erase(generalization);
}

AssociationClass::AssociationClass(std::string name, ElementSet<Property> attributes,
    Association* association, Synonyms synonyms)
    : Class(std::move(name), std::move(attributes), {}, false, false, std::move(synonyms)) {
    set_association(association);
}

void AssociationClass::set_association(Association* association) {
    if (!association)
        reject<InvalidValue>("Association class '" + name() + "' needs an association.");
    association_ = association;
}

} // namespace metamodel
