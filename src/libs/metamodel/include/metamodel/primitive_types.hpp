#pragma once

#include <metamodel/types.hpp>
#include <string_view>

namespace metamodel {

// Process-wide primitive registry. The eight instances are created on first
// use and never destroyed before exit; compare them by address.
const ElementSet<PrimitiveDataType>& primitive_types();

PrimitiveDataType* string_type();
PrimitiveDataType* integer_type();
PrimitiveDataType* float_type();
PrimitiveDataType* boolean_type();
PrimitiveDataType* time_type();
PrimitiveDataType* date_type();
PrimitiveDataType* datetime_type();
PrimitiveDataType* timedelta_type();

// Resolves the eight primitive names plus the alias "string". Returns null for
// anything else.
PrimitiveDataType* find_primitive_type(std::string_view name);

} // namespace metamodel
