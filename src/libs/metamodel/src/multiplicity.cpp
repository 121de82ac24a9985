#include <metamodel/multiplicity.hpp>
#include "validation.hpp"

namespace metamodel {

namespace {

int parse_max(std::string_view max) {
    if (max == "*") return unlimited_max_multiplicity;
    reject<InvalidValue>("Invalid max multiplicity: '" + std::string(max) + "'.");
}

void check_bounds(int min, int max) {
    if (min < 0)
        reject<InvalidValue>("Invalid min multiplicity: " + std::to_string(min) + ".");
    if (max < 0 || max < min)
        reject<InvalidValue>("Invalid max multiplicity: " + std::to_string(max)
            + " (min is " + std::to_string(min) + ").");
}

} // namespace

Multiplicity::Multiplicity(int min, int max) {
    check_bounds(min, max);
    min_ = min;
    max_ = max;
}

Multiplicity::Multiplicity(int min, std::string_view max)
    : Multiplicity(min, parse_max(max)) {}

void Multiplicity::set_min(int min) {
    check_bounds(min, max_);
    min_ = min;
}

void Multiplicity::set_max(int max) {
    check_bounds(min_, max);
    max_ = max;
}

void Multiplicity::set_max(std::string_view max) {
    set_max(parse_max(max));
}

std::string Multiplicity::to_string() const {
    const std::string upper = is_unbounded() ? "*" : std::to_string(max_);
    if (min_ == max_) return upper;
    return std::to_string(min_) + ".." + upper;
}

} // namespace metamodel
