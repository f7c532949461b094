#include "utils.hpp"
#include "errors.hpp"
#include <cctype>
#include <cstring>
#include <fstream>

std::string bytes_to_hex(const Bytes& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::string bytes_to_hex(const uint8_t* bytes, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

Bytes unhexlify(const std::string& hex_str) {
    if (hex_str.length() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length: " + std::to_string(hex_str.length()));
    }
    Bytes bytes;
    bytes.reserve(hex_str.length() / 2);
    for (size_t i = 0; i < hex_str.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex_str[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex_str[i + 1]))) {
            throw std::invalid_argument("Invalid hex digit at position " + std::to_string(i));
        }
        std::string byteString = hex_str.substr(i, 2);
        uint8_t byte = static_cast<uint8_t>(strtol(byteString.c_str(), nullptr, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

std::vector<std::string> split_string(const std::string& s, const std::string& delimiter) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    std::string::size_type end = 0;

    while ((end = s.find(delimiter, start)) != std::string::npos) {
        tokens.push_back(s.substr(start, end - start));
        start = end + delimiter.size();
    }
    tokens.push_back(s.substr(start));

    return tokens;
}

std::string format_hex32(uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

long long parse_integer(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty integer value");
    }
    // Decimal, or hexadecimal with a 0x prefix; a leading zero never means octal
    size_t pos = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    int base = 10;
    if (text.size() > pos + 1 && text[pos] == '0' && (text[pos + 1] == 'x' || text[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }
    if (pos == text.size()) {
        throw std::invalid_argument("Integer value '" + text + "' has no digits");
    }
    for (size_t i = pos; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (base == 16 ? !std::isxdigit(c) : !std::isdigit(c)) {
            throw std::invalid_argument("Invalid character in integer value '" + text + "'");
        }
    }
    long long value = std::stoll(text.substr(pos), nullptr, base);
    return text[0] == '-' ? -value : value;
}

std::string ident_from_bytes(const char* ident) {
    return std::string(ident, 4);
}

void ident_to_bytes(const std::string& ident, char* out) {
    if (ident.size() != 4) {
        throw EncodeError("Identifier '" + ident + "' is not 4 bytes long");
    }
    std::memcpy(out, ident.data(), 4);
}

uint64_t count_from_stored(uint32_t stored) {
    return static_cast<uint64_t>(stored) + 1;
}

uint32_t count_to_stored(size_t count, const std::string& what) {
    if (count == 0) {
        throw EncodeError("Cannot store an empty list of " + what);
    }
    if (count - 1 > 0xFFFFFFFFull) {
        throw EncodeError("Too many " + what + ": " + std::to_string(count));
    }
    return static_cast<uint32_t>(count - 1);
}

Bytes read_filepath(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    Bytes buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer;
}

void write_filepath(const std::filesystem::path& path, const Bytes& data) {
    std::ofstream out_f(path, std::ios::binary | std::ios::trunc);
    if (!out_f) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    out_f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out_f) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}
