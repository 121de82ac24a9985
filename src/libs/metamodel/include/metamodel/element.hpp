#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace metamodel {

enum class Visibility { Public, Private, Protected, Package };

// Throws InvalidValue for anything but "public", "private", "protected", "package".
Visibility visibility_from_string(std::string_view text);
std::string_view to_string(Visibility visibility);

// Root of every model element. Elements are identity-bearing: they cannot be
// copied or moved, and two elements are equal only if they are the same object.
class Element {
public:
    using Clock = std::chrono::system_clock;

    Element();
    virtual ~Element() = default;

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    // Strictly increasing across every element created in the process.
    std::uint64_t creation_order() const { return creation_order_; }

    Clock::time_point timestamp() const { return timestamp_; }
    void set_timestamp(Clock::time_point timestamp) { timestamp_ = timestamp; }

private:
    std::uint64_t creation_order_;
    Clock::time_point timestamp_;
};

struct CreationOrderLess {
    bool operator()(const Element* a, const Element* b) const {
        if (!a || !b) return !a && b;
        return a->creation_order() < b->creation_order();
    }
};

// Identity set iterated in construction order.
template <typename T>
using ElementSet = std::set<T*, CreationOrderLess>;

template <typename T>
std::vector<T*> sort_by_creation_order(const ElementSet<T>& elements) {
    return std::vector<T*>(elements.begin(), elements.end());
}

template <typename T>
std::vector<T*> sort_by_creation_order(std::vector<T*> elements) {
    std::sort(elements.begin(), elements.end(), CreationOrderLess{});
    return elements;
}

class NamedElement : public Element {
public:
    using Synonyms = std::optional<std::vector<std::string>>;

    explicit NamedElement(std::string name, Synonyms synonyms = std::nullopt,
        Visibility visibility = Visibility::Public);

    const std::string& name() const { return name_; }
    virtual void set_name(std::string name);

    const Synonyms& synonyms() const { return synonyms_; }
    virtual void set_synonyms(Synonyms synonyms);

    Visibility visibility() const { return visibility_; }
    virtual void set_visibility(Visibility visibility);
    void set_visibility(std::string_view visibility);

private:
    std::string name_;
    Synonyms synonyms_;
    Visibility visibility_ = Visibility::Public;
};

} // namespace metamodel
