#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Base class for every fatal condition raised while reading or writing an RSRC file.
// The offset, when known, is absolute within the buffer being parsed.
class RsrcError : public std::runtime_error {
public:
    explicit RsrcError(const std::string& message, std::optional<size_t> offset = std::nullopt)
        : std::runtime_error(format_message(message, offset)), offset_(offset) {}

    std::optional<size_t> offset() const { return offset_; }

private:
    static std::string format_message(const std::string& message, std::optional<size_t> offset);

    std::optional<size_t> offset_;
};

// Bad magic or creator tag, or the two RSRC headers disagree.
class FormatError : public RsrcError {
public:
    using RsrcError::RsrcError;
};

// An offset or length points past the end of the buffer.
class TruncatedDataError : public RsrcError {
public:
    using RsrcError::RsrcError;
};

// Offsets overlap or appear in an order the layout does not allow.
class CorruptOffsetError : public RsrcError {
public:
    using RsrcError::RsrcError;
};

// A value cannot be stored in its fixed-width slot.
class EncodeError : public RsrcError {
public:
    using RsrcError::RsrcError;
};

// The requested codec variant does not exist for the detected layout or version.
class VersionMismatchError : public RsrcError {
public:
    using RsrcError::RsrcError;
};

enum class WarningKind {
    Compression,
    UnknownBlockTag,
    MalformedBlock
};

// Non-fatal anomaly recorded next to a decoded tree.
struct DecodeWarning {
    WarningKind kind;
    std::string block;
    int32_t section;
    std::string message;
};

const char* warning_kind_name(WarningKind kind);
std::string format_warning(const DecodeWarning& warning);

#endif // ERRORS_HPP
