#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace iqdec {

enum class ErrorKind {
    StructuralMismatch, // file size or header shape violates a format invariant
    OutOfRange,         // requested window exceeds available samples/records/blocks
    MalformedMetadata,  // a required header key is absent or not numeric
    Io,                 // unreadable or truncated file
};

const char* to_string(ErrorKind kind);

// Every probe/read failure surfaces as a DecodeError. what() reads
// "<format>: <detail> [<field>]".
class DecodeError : public std::runtime_error {
public:
    DecodeError(ErrorKind kind, std::string format, std::string detail, std::string field = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& format() const noexcept { return format_; }
    const std::string& field() const noexcept { return field_; }

private:
    ErrorKind kind_;
    std::string format_;
    std::string field_;
};

[[noreturn]] void throw_structural(std::string_view format, std::string detail, std::string field = {});
[[noreturn]] void throw_out_of_range(std::string_view format, std::string detail, std::string field = {});
[[noreturn]] void throw_malformed(std::string_view format, std::string detail, std::string field = {});
[[noreturn]] void throw_io(std::string_view format, std::string detail, std::string field = {});

} // namespace iqdec
