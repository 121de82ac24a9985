#pragma once

#include <metamodel/aggregates.hpp>
#include <metamodel/arena.hpp>
#include <metamodel/class.hpp>
#include <metamodel/domain_model.hpp>
#include <metamodel/element.hpp>
#include <metamodel/error.hpp>
#include <metamodel/log.hpp>
#include <metamodel/members.hpp>
#include <metamodel/multiplicity.hpp>
#include <metamodel/primitive_types.hpp>
#include <metamodel/relationships.hpp>
#include <metamodel/types.hpp>
