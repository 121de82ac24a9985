#include <metamodel/types.hpp>
#include <metamodel/primitive_types.hpp>
#include "validation.hpp"
#include <array>
#include <utility>

namespace metamodel {

namespace {

const std::array<const char*, 8> primitive_names = {
    "int", "float", "str", "bool", "time", "date", "datetime", "timedelta"
};

} // namespace

bool is_primitive_type_name(const std::string& name) {
    for (const char* candidate : primitive_names)
        if (name == candidate) return true;
    return false;
}

Type::Type(std::string name, Synonyms synonyms)
    : NamedElement(std::move(name), std::move(synonyms)) {}

PrimitiveDataType::PrimitiveDataType(std::string name, Synonyms synonyms)
    : DataType(name, std::move(synonyms)) {
    if (!is_primitive_type_name(name))
        reject<InvalidPrimitiveType>("Invalid primitive data type: '" + name + "'.");
}

void PrimitiveDataType::set_name(std::string name) {
    reject_if_shared("renamed");
    if (!is_primitive_type_name(name))
        reject<InvalidPrimitiveType>("Invalid primitive data type: '" + name + "'.");
    DataType::set_name(std::move(name));
}

void PrimitiveDataType::set_synonyms(Synonyms synonyms) {
    reject_if_shared("given synonyms");
    DataType::set_synonyms(std::move(synonyms));
}

void PrimitiveDataType::set_visibility(Visibility visibility) {
    reject_if_shared("given a visibility");
    DataType::set_visibility(visibility);
}

void PrimitiveDataType::reject_if_shared(const char* what) {
    if (primitive_types().count(this))
        reject<InvalidValue>("Primitive type '" + name() + "' is shared and cannot be "
            + what + ".");
}

EnumerationLiteral::EnumerationLiteral(std::string name, DataType* owner, Synonyms synonyms)
    : NamedElement(std::move(name), std::move(synonyms)) {
    set_owner(owner);
}

void EnumerationLiteral::set_owner(DataType* owner) {
    if (dynamic_cast<PrimitiveDataType*>(owner))
        reject<InvalidOwner>("Enumeration literal '" + name()
            + "' cannot be owned by primitive type '" + owner->name() + "'.");
    owner_ = owner;
}

Enumeration::Enumeration(std::string name, ElementSet<EnumerationLiteral> literals, Synonyms synonyms)
    : DataType(std::move(name), std::move(synonyms)) {
    set_literals(std::move(literals));
}

void Enumeration::set_literals(ElementSet<EnumerationLiteral> literals) {
    reject_null_members(literals, "Enumeration '" + name() + "'");
    auto duplicates = duplicate_names(literals);
    if (!duplicates.empty())
        reject<DuplicateName>("An enumeration cannot have two literals with the same name: "
            + join_names(duplicates) + ".");
    for (EnumerationLiteral* literal : literals)
        literal->set_owner(this);
    literals_ = std::move(literals);
}

void Enumeration::add_literal(EnumerationLiteral& literal) {
    if (this->literal(literal.name()))
        reject<DuplicateName>("An enumeration cannot have two literals with the same name: '"
            + literal.name() + "'.");
    literal.set_owner(this);
    literals_.insert(&literal);
}

EnumerationLiteral* Enumeration::literal(const std::string& name) const {
    for (EnumerationLiteral* literal : literals_)
        if (literal->name() == name) return literal;
    return nullptr;
}

} // namespace metamodel
