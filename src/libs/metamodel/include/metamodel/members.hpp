#pragma once

#include <metamodel/element.hpp>
#include <metamodel/multiplicity.hpp>
#include <metamodel/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace metamodel {

// Either a resolved type or a type name. Names are resolved once, against the
// primitive registry first; an unknown name becomes a plain Type shared by the
// elements that reference it.
using TypeRef = std::variant<Type*, std::string>;

class TypedElement : public NamedElement {
public:
    TypedElement(std::string name, TypeRef type, Visibility visibility = Visibility::Public);

    Type* type() const { return type_; }
    virtual void set_type(TypeRef type);

protected:
    // Resolves without committing. `storage` receives a share of the type
    // when it is an ad hoc one, and stays empty otherwise.
    static Type* resolve(TypeRef ref, std::shared_ptr<Type>& storage);
    void commit_type(Type* type, std::shared_ptr<Type> storage);

private:
    Type* type_ = nullptr;
    std::shared_ptr<Type> owned_type_;
};

// An attribute of a class or an end of an association.
class Property : public TypedElement {
public:
    Property(std::string name, TypeRef type, Multiplicity multiplicity = Multiplicity(1, 1),
        Visibility visibility = Visibility::Public, bool is_composite = false,
        bool is_navigable = true, bool is_id = false, bool is_read_only = false);

    // Retyping an association end moves the association's back-reference
    // to the new class.
    void set_type(TypeRef type) override;

    NamedElement* owner() const { return owner_; }
    void set_owner(NamedElement* owner);

    const Multiplicity& multiplicity() const { return multiplicity_; }
    Multiplicity& multiplicity() { return multiplicity_; }
    void set_multiplicity(const Multiplicity& multiplicity) { multiplicity_ = multiplicity; }

    bool is_composite() const { return is_composite_; }
    void set_composite(bool value) { is_composite_ = value; }
    bool is_navigable() const { return is_navigable_; }
    void set_navigable(bool value) { is_navigable_ = value; }
    bool is_id() const { return is_id_; }
    void set_id(bool value) { is_id_ = value; }
    bool is_read_only() const { return is_read_only_; }
    void set_read_only(bool value) { is_read_only_ = value; }

private:
    NamedElement* owner_ = nullptr;
    Multiplicity multiplicity_;
    bool is_composite_ = false;
    bool is_navigable_ = true;
    bool is_id_ = false;
    bool is_read_only_ = false;
};

class Parameter : public TypedElement {
public:
    Parameter(std::string name, TypeRef type,
        std::optional<std::string> default_value = std::nullopt);

    const std::optional<std::string>& default_value() const { return default_value_; }
    void set_default_value(std::optional<std::string> value) { default_value_ = std::move(value); }

private:
    std::optional<std::string> default_value_;
};

class Method : public TypedElement {
public:
    // A method without a declared return type returns "OclVoid".
    explicit Method(std::string name, ElementSet<Parameter> parameters = {},
        TypeRef type = std::string("OclVoid"), Visibility visibility = Visibility::Public,
        bool is_abstract = false, std::string code = {});

    const ElementSet<Parameter>& parameters() const { return parameters_; }
    void set_parameters(ElementSet<Parameter> parameters);
    void add_parameter(Parameter& parameter);
    Parameter* parameter(const std::string& name) const;

    NamedElement* owner() const { return owner_; }
    void set_owner(NamedElement* owner);

    bool is_abstract() const { return is_abstract_; }
    void set_abstract(bool value) { is_abstract_ = value; }

    const std::string& code() const { return code_; }
    void set_code(std::string code) { code_ = std::move(code); }

private:
    ElementSet<Parameter> parameters_;
    NamedElement* owner_ = nullptr;
    bool is_abstract_ = false;
    std::string code_;
};

} // namespace metamodel
