#include "errors.hpp"
#include <sstream>

std::string RsrcError::format_message(const std::string& message, std::optional<size_t> offset) {
    if (!offset.has_value()) {
        return message;
    }
    std::ostringstream oss;
    oss << message << " (at offset 0x" << std::hex << *offset << ")";
    return oss.str();
}

const char* warning_kind_name(WarningKind kind) {
    switch (kind) {
        case WarningKind::Compression: return "CompressionWarning";
        case WarningKind::UnknownBlockTag: return "UnknownBlockTag";
        case WarningKind::MalformedBlock: return "MalformedBlock";
    }
    return "Warning";
}

std::string format_warning(const DecodeWarning& warning) {
    std::ostringstream oss;
    oss << warning_kind_name(warning.kind) << ": block '" << warning.block
        << "' section " << warning.section << ": " << warning.message;
    return oss.str();
}
