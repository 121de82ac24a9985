#pragma once

#include <metamodel/element.hpp>
#include <metamodel/error.hpp>
#include <metamodel/log.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace metamodel {

template <typename Error>
[[noreturn]] void reject(const std::string& message) {
    logger()->debug("rejected: {}", message);
    throw Error(message);
}

// Names occurring more than once, in order of their second occurrence.
template <typename T>
std::vector<std::string> duplicate_names(const ElementSet<T>& elements) {
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> reported;
    std::vector<std::string> out;
    for (const T* element : elements) {
        if (!seen.insert(element->name()).second && reported.insert(element->name()).second)
            out.push_back(element->name());
    }
    return out;
}

inline std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

template <typename T>
void reject_null_members(const ElementSet<T>& elements, const std::string& what) {
    if (elements.count(nullptr))
        reject<InvalidValue>(what + " cannot contain a null element.");
}

} // namespace metamodel
