#include "iqdec/error.hpp"

namespace iqdec {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::StructuralMismatch: return "structural mismatch";
        case ErrorKind::OutOfRange: return "out of range";
        case ErrorKind::MalformedMetadata: return "malformed metadata";
        case ErrorKind::Io: return "i/o failure";
    }
    return "unknown";
}

static std::string compose(const std::string& format, const std::string& detail, const std::string& field) {
    std::string msg = format + ": " + detail;
    if (!field.empty()) msg += " [" + field + "]";
    return msg;
}

DecodeError::DecodeError(ErrorKind kind, std::string format, std::string detail, std::string field)
    : std::runtime_error(compose(format, detail, field)),
      kind_(kind),
      format_(std::move(format)),
      field_(std::move(field)) {}

void throw_structural(std::string_view format, std::string detail, std::string field) {
    throw DecodeError(ErrorKind::StructuralMismatch, std::string(format), std::move(detail), std::move(field));
}

void throw_out_of_range(std::string_view format, std::string detail, std::string field) {
    throw DecodeError(ErrorKind::OutOfRange, std::string(format), std::move(detail), std::move(field));
}

void throw_malformed(std::string_view format, std::string detail, std::string field) {
    throw DecodeError(ErrorKind::MalformedMetadata, std::string(format), std::move(detail), std::move(field));
}

void throw_io(std::string_view format, std::string detail, std::string field) {
    throw DecodeError(ErrorKind::Io, std::string(format), std::move(detail), std::move(field));
}

} // namespace iqdec
