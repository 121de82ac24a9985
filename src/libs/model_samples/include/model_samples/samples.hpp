#pragma once

#include <metamodel/arena.hpp>
#include <metamodel/domain_model.hpp>
#include <string>
#include <vector>

namespace model_samples {

// Library / Book / Author, with Author specializing Person.
metamodel::DomainModel& make_library_model(metamodel::Arena& arena);

// RPG roguelike classes: deep single inheritance, a class with three parents,
// composite component associations and a self-association.
metamodel::DomainModel& make_game_model(metamodel::Arena& arena);

std::vector<std::string> sample_names();

// Null for an unknown name.
metamodel::DomainModel* make_sample_model(const std::string& name, metamodel::Arena& arena);

} // namespace model_samples
