#pragma once

#include <metamodel/element.hpp>
#include <memory>
#include <string>

namespace metamodel {

// Ad hoc types named by a typed element are held by shared_ptr; every element
// referring to one of them shares its ownership.
class Type : public NamedElement, public std::enable_shared_from_this<Type> {
public:
    explicit Type(std::string name, Synonyms synonyms = std::nullopt);
};

class DataType : public Type {
public:
    using Type::Type;
};

// One of the eight built-in scalar types. The shared instances live in the
// primitive registry (primitive_types.hpp) and reject every change with
// InvalidValue; construct others only to compare.
class PrimitiveDataType : public DataType {
public:
    explicit PrimitiveDataType(std::string name, Synonyms synonyms = std::nullopt);

    using NamedElement::set_visibility;

    void set_name(std::string name) override;
    void set_synonyms(Synonyms synonyms) override;
    void set_visibility(Visibility visibility) override;

private:
    void reject_if_shared(const char* what);
};

bool is_primitive_type_name(const std::string& name);

class EnumerationLiteral : public NamedElement {
public:
    explicit EnumerationLiteral(std::string name, DataType* owner = nullptr,
        Synonyms synonyms = std::nullopt);

    DataType* owner() const { return owner_; }
    // A primitive data type cannot own a literal.
    void set_owner(DataType* owner);

private:
    DataType* owner_ = nullptr;
};

class Enumeration : public DataType {
public:
    explicit Enumeration(std::string name, ElementSet<EnumerationLiteral> literals = {},
        Synonyms synonyms = std::nullopt);

    const ElementSet<EnumerationLiteral>& literals() const { return literals_; }
    void set_literals(ElementSet<EnumerationLiteral> literals);
    void add_literal(EnumerationLiteral& literal);

    EnumerationLiteral* literal(const std::string& name) const;

private:
    ElementSet<EnumerationLiteral> literals_;
};

} // namespace metamodel
