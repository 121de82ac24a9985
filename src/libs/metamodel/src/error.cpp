#include <metamodel/error.hpp>

namespace metamodel {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidValue: return "InvalidValue";
    case ErrorKind::InvalidPrimitiveType: return "InvalidPrimitiveType";
    case ErrorKind::DuplicateName: return "DuplicateName";
    case ErrorKind::MultipleIdentifiers: return "MultipleIdentifiers";
    case ErrorKind::InvalidOwner: return "InvalidOwner";
    case ErrorKind::SelfGeneralization: return "SelfGeneralization";
    case ErrorKind::ArityViolation: return "ArityViolation";
    case ErrorKind::CyclicGeneralization: return "CyclicGeneralization";
    }
    return "Unknown";
}

ModelError::ModelError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace metamodel
