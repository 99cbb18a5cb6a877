#pragma once
#include <stdexcept>
#include <string>

namespace renko {

enum class ErrorKind {
    InvalidRecord,
    InsufficientData,
    DegenerateSeries,
    NoBricksFormed,
    SourceNotFound,
    UnsupportedFormat,
    MissingRequiredField,
};

const char* to_string(ErrorKind kind);

class RenkoError : public std::runtime_error {
public:
    RenkoError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace renko
