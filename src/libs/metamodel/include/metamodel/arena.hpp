#pragma once

#include <metamodel/element.hpp>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace metamodel {

// Owns model elements for the lifetime of a model. Elements point at each
// other (types, owners, back-references) without owning; keeping every element
// of one model in the same arena keeps those pointers valid.
class Arena {
public:
    Arena() = default;
    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    template <typename T, typename... Args>
    T& make(Args&&... args) {
        static_assert(std::is_base_of_v<Element, T>, "Arena only holds model elements");
        // Reserve first: once constructed, an element may already be linked
        // into other elements' back-references and must not be lost.
        if (elements_.size() == elements_.capacity())
            elements_.reserve(std::max<std::size_t>(16, elements_.capacity() * 2));
        auto element = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *element;
        elements_.push_back(std::move(element));
        return ref;
    }

    std::size_t size() const { return elements_.size(); }
    std::size_t capacity() const { return elements_.capacity(); }

private:
    std::vector<std::unique_ptr<Element>> elements_;
};

} // namespace metamodel
