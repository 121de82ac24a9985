#pragma once

#include <metamodel/class.hpp>
#include <metamodel/relationships.hpp>
#include <string>

namespace metamodel {

class GeneralizationSet : public NamedElement {
public:
    GeneralizationSet(std::string name, ElementSet<Generalization> generalizations,
        bool is_disjoint, bool is_complete, Synonyms synonyms = std::nullopt);

    const ElementSet<Generalization>& generalizations() const { return generalizations_; }
    void set_generalizations(ElementSet<Generalization> generalizations);

    bool is_disjoint() const { return is_disjoint_; }
    void set_disjoint(bool value) { is_disjoint_ = value; }
    bool is_complete() const { return is_complete_; }
    void set_complete(bool value) { is_complete_ = value; }

private:
    ElementSet<Generalization> generalizations_;
    bool is_disjoint_ = false;
    bool is_complete_ = false;
};

class Package : public NamedElement {
public:
    explicit Package(std::string name, ElementSet<Class> classes = {},
        Synonyms synonyms = std::nullopt);

    const ElementSet<Class>& classes() const { return classes_; }
    void set_classes(ElementSet<Class> classes);
    void add_class(Class& cls);

private:
    ElementSet<Class> classes_;
};

// A rule over instances of `context`, written in `language` (e.g. "OCL").
class Constraint : public NamedElement {
public:
    Constraint(std::string name, Class* context, std::string expression, std::string language,
        Synonyms synonyms = std::nullopt);

    Class* context() const { return context_; }
    void set_context(Class* context);

    const std::string& expression() const { return expression_; }
    void set_expression(std::string expression) { expression_ = std::move(expression); }

    const std::string& language() const { return language_; }
    void set_language(std::string language) { language_ = std::move(language); }

private:
    Class* context_ = nullptr;
    std::string expression_;
    std::string language_;
};

} // namespace metamodel
