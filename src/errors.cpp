#include "../include/renko/errors.hpp"

namespace renko {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRecord: return "InvalidRecord";
        case ErrorKind::InsufficientData: return "InsufficientData";
        case ErrorKind::DegenerateSeries: return "DegenerateSeries";
        case ErrorKind::NoBricksFormed: return "NoBricksFormed";
        case ErrorKind::SourceNotFound: return "SourceNotFound";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::MissingRequiredField: return "MissingRequiredField";
    }
    return "Unknown";
}

} // namespace renko
