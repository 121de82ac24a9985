#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace metamodel {

enum class ErrorKind {
    InvalidValue,
    InvalidPrimitiveType,
    DuplicateName,
    MultipleIdentifiers,
    InvalidOwner,
    SelfGeneralization,
    ArityViolation,
    CyclicGeneralization
};

std::string_view to_string(ErrorKind kind);

// Base of every integrity violation. A mutation that throws leaves the element
// it was called on unchanged.
class ModelError : public std::runtime_error {
public:
    ModelError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad visibility, bad multiplicity bounds, unusable type reference.
class InvalidValue : public ModelError {
public:
    explicit InvalidValue(const std::string& message)
        : ModelError(ErrorKind::InvalidValue, message) {}

protected:
    InvalidValue(ErrorKind kind, const std::string& message)
        : ModelError(kind, message) {}
};

class InvalidPrimitiveType : public InvalidValue {
public:
    explicit InvalidPrimitiveType(const std::string& message)
        : InvalidValue(ErrorKind::InvalidPrimitiveType, message) {}
};

class DuplicateName : public ModelError {
public:
    explicit DuplicateName(const std::string& message)
        : ModelError(ErrorKind::DuplicateName, message) {}
};

class MultipleIdentifiers : public ModelError {
public:
    explicit MultipleIdentifiers(const std::string& message)
        : ModelError(ErrorKind::MultipleIdentifiers, message) {}
};

class InvalidOwner : public ModelError {
public:
    explicit InvalidOwner(const std::string& message)
        : ModelError(ErrorKind::InvalidOwner, message) {}
};

class SelfGeneralization : public ModelError {
public:
    explicit SelfGeneralization(const std::string& message)
        : ModelError(ErrorKind::SelfGeneralization, message) {}
};

// Association with fewer than two ends, binary association with a wrong end
// count or with both ends composite.
class ArityViolation : public ModelError {
public:
    explicit ArityViolation(const std::string& message)
        : ModelError(ErrorKind::ArityViolation, message) {}
};

class CyclicGeneralization : public ModelError {
public:
    explicit CyclicGeneralization(const std::string& message)
        : ModelError(ErrorKind::CyclicGeneralization, message) {}
};

} // namespace metamodel
