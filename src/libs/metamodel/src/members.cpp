#include <metamodel/members.hpp>
#include <metamodel/class.hpp>
#include <metamodel/primitive_types.hpp>
#include <metamodel/relationships.hpp>
#include "validation.hpp"
#include <utility>

namespace metamodel {

namespace {

void check_member_owner(const NamedElement* owner, const std::string& member) {
    if (dynamic_cast<const DataType*>(owner))
        reject<InvalidOwner>("'" + member + "' cannot be owned by data type '" + owner->name() + "'.");
}

} // namespace

TypedElement::TypedElement(std::string name, TypeRef type, Visibility visibility)
    : NamedElement(std::move(name), std::nullopt, visibility) {
    std::shared_ptr<Type> storage;
    Type* resolved = resolve(std::move(type), storage);
    commit_type(resolved, std::move(storage));
}

Type* TypedElement::resolve(TypeRef ref, std::shared_ptr<Type>& storage) {
    if (auto* type = std::get_if<Type*>(&ref)) {
        if (!*type) reject<InvalidValue>("Invalid type: null.");
        // Empty unless the type is an ad hoc one held by another element.
        storage = (*type)->weak_from_this().lock();
        return *type;
    }
    auto& name = std::get<std::string>(ref);
    if (PrimitiveDataType* primitive = find_primitive_type(name)) return primitive;
    storage = std::make_shared<Type>(std::move(name));
    return storage.get();
}

void TypedElement::commit_type(Type* type, std::shared_ptr<Type> storage) {
    type_ = type;
    owned_type_ = std::move(storage);
}

void TypedElement::set_type(TypeRef type) {
    std::shared_ptr<Type> storage;
    Type* resolved = resolve(std::move(type), storage);
    commit_type(resolved, std::move(storage));
}

Property::Property(std::string name, TypeRef type, Multiplicity multiplicity, Visibility visibility,
    bool is_composite, bool is_navigable, bool is_id, bool is_read_only)
    : TypedElement(std::move(name), std::move(type), visibility),
      multiplicity_(multiplicity),
      is_composite_(is_composite),
      is_navigable_(is_navigable),
      is_id_(is_id),
      is_read_only_(is_read_only) {}

void Property::set_type(TypeRef type) {
    auto* association = dynamic_cast<Association*>(owner_);
    if (!association || !association->ends().count(this)) {
        TypedElement::set_type(std::move(type));
        return;
    }

    std::shared_ptr<Type> storage;
    Type* resolved = resolve(std::move(type), storage);
    auto* new_class = dynamic_cast<Class*>(resolved);
    if (!new_class)
        reject<InvalidValue>("Association end '" + name() + "' of '" + association->name()
            + "' must be typed by a class, not '" + resolved->name() + "'.");
    auto* old_class = dynamic_cast<Class*>(this->type());
    commit_type(resolved, std::move(storage));
    association->end_retyped(old_class);
}

void Property::set_owner(NamedElement* owner) {
    check_member_owner(owner, name());
    owner_ = owner;
}

Parameter::Parameter(std::string name, TypeRef type, std::optional<std::string> default_value)
    : TypedElement(std::move(name), std::move(type)), default_value_(std::move(default_value)) {}

Method::Method(std::string name, ElementSet<Parameter> parameters, TypeRef type,
    Visibility visibility, bool is_abstract, std::string code)
    : TypedElement(std::move(name), std::move(type), visibility),
      is_abstract_(is_abstract),
      code_(std::move(code)) {
    set_parameters(std::move(parameters));
}

void Method::set_parameters(ElementSet<Parameter> parameters) {
    reject_null_members(parameters, "Method '" + name() + "'");
    auto duplicates = duplicate_names(parameters);
    if (!duplicates.empty())
        reject<DuplicateName>("A method cannot have parameters with duplicate names: "
            + join_names(duplicates) + ".");
    parameters_ = std::move(parameters);
}

void Method::add_parameter(Parameter& parameter) {
    if (this->parameter(parameter.name()))
        reject<DuplicateName>("A method cannot have two parameters with the same name: '"
            + parameter.name() + "'.");
    parameters_.insert(&parameter);
}

Parameter* Method::parameter(const std::string& name) const {
    for (Parameter* parameter : parameters_)
        if (parameter->name() == name) return parameter;
    return nullptr;
}

void Method::set_owner(NamedElement* owner) {
    check_member_owner(owner, name());
    owner_ = owner;
}

} // namespace metamodel
