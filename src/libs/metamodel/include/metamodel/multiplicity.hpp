#pragma once

#include <string>
#include <string_view>

namespace metamodel {

// Stand-in for an unbounded upper multiplicity ("*").
constexpr int unlimited_max_multiplicity = 9999;

class Multiplicity {
public:
    Multiplicity(int min, int max);
    // max must be "*".
    Multiplicity(int min, std::string_view max);

    int min() const { return min_; }
    int max() const { return max_; }

    void set_min(int min);
    void set_max(int max);
    void set_max(std::string_view max);

    bool is_unbounded() const { return max_ == unlimited_max_multiplicity; }

    // "1", "0..1", "1..*".
    std::string to_string() const;

    bool operator==(const Multiplicity& other) const {
        return min_ == other.min_ && max_ == other.max_;
    }

private:
    int min_ = 1;
    int max_ = 1;
};

} // namespace metamodel
