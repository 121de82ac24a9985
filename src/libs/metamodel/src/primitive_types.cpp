#include <metamodel/primitive_types.hpp>

namespace metamodel {

namespace {

struct PrimitiveRegistry {
    PrimitiveDataType string_type{"str"};
    PrimitiveDataType integer_type{"int"};
    PrimitiveDataType float_type{"float"};
    PrimitiveDataType boolean_type{"bool"};
    PrimitiveDataType time_type{"time"};
    PrimitiveDataType date_type{"date"};
    PrimitiveDataType datetime_type{"datetime"};
    PrimitiveDataType timedelta_type{"timedelta"};
    ElementSet<PrimitiveDataType> all{
        &string_type, &integer_type, &float_type, &boolean_type,
        &time_type, &date_type, &datetime_type, &timedelta_type
    };
};

PrimitiveRegistry& registry() {
    static PrimitiveRegistry instance;
    return instance;
}

} // namespace

const ElementSet<PrimitiveDataType>& primitive_types() { return registry().all; }

PrimitiveDataType* string_type() { return &registry().string_type; }
PrimitiveDataType* integer_type() { return &registry().integer_type; }
PrimitiveDataType* float_type() { return &registry().float_type; }
PrimitiveDataType* boolean_type() { return &registry().boolean_type; }
PrimitiveDataType* time_type() { return &registry().time_type; }
PrimitiveDataType* date_type() { return &registry().date_type; }
PrimitiveDataType* datetime_type() { return &registry().datetime_type; }
PrimitiveDataType* timedelta_type() { return &registry().timedelta_type; }

PrimitiveDataType* find_primitive_type(std::string_view name) {
    auto& r = registry();
    if (name == "str" || name == "string") return &r.string_type;
    if (name == "int") return &r.integer_type;
    if (name == "float") return &r.float_type;
    if (name == "bool") return &r.boolean_type;
    if (name == "time") return &r.time_type;
    if (name == "date") return &r.date_type;
    if (name == "datetime") return &r.datetime_type;
    if (name == "timedelta") return &r.timedelta_type;
    return nullptr;
}

} // namespace metamodel
