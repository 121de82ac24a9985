#include <metamodel/element.hpp>
#include "validation.hpp"
#include <atomic>
#include <utility>

namespace metamodel {

namespace {

std::atomic<std::uint64_t> next_creation_order{1};

} // namespace

Visibility visibility_from_string(std::string_view text) {
    if (text == "public") return Visibility::Public;
    if (text == "private") return Visibility::Private;
    if (text == "protected") return Visibility::Protected;
    if (text == "package") return Visibility::Package;
    reject<InvalidValue>("Invalid value of visibility: '" + std::string(text) + "'.");
}

std::string_view to_string(Visibility visibility) {
    switch (visibility) {
    case Visibility::Public: return "public";
    case Visibility::Private: return "private";
    case Visibility::Protected: return "protected";
    case Visibility::Package: return "package";
    }
    return "public";
}

Element::Element()
    : creation_order_(next_creation_order.fetch_add(1, std::memory_order_relaxed)),
      timestamp_(Clock::now()) {}

NamedElement::NamedElement(std::string name, Synonyms synonyms, Visibility visibility)
    : name_(std::move(name)), synonyms_(std::move(synonyms)), visibility_(visibility) {}

void NamedElement::set_name(std::string name) {
    name_ = std::move(name);
}

void NamedElement::set_synonyms(Synonyms synonyms) {
    synonyms_ = std::move(synonyms);
}

void NamedElement::set_visibility(Visibility visibility) {
    visibility_ = visibility;
}

void NamedElement::set_visibility(std::string_view visibility) {
    set_visibility(visibility_from_string(visibility));
}

} // namespace metamodel
