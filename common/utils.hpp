#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <nlohmann/json.hpp>

// Use nlohmann::ordered_json to preserve the order of attributes in the tree document
using json = nlohmann::ordered_json;

using Bytes = std::vector<uint8_t>;

// Converts a vector of bytes to a hex string.
std::string bytes_to_hex(const Bytes& bytes);
std::string bytes_to_hex(const uint8_t* bytes, size_t size);

// Decodes a hex string into a vector of bytes. Throws std::invalid_argument on malformed input.
Bytes unhexlify(const std::string& hex_str);

// Splits a string by a delimiter string.
std::vector<std::string> split_string(const std::string& s, const std::string& delimiter);

// Formats a 32-bit value as 0xXXXXXXXX.
std::string format_hex32(uint32_t value);

// Parses a decimal or 0x-prefixed integer. Throws std::invalid_argument on malformed input.
long long parse_integer(const std::string& text);

// Four-character block/file identifiers are kept as std::string of exactly 4 bytes.
std::string ident_from_bytes(const char* ident);
void ident_to_bytes(const std::string& ident, char* out);

// Counts of blocks and sections are stored as (true count - 1); a stored 0 means one entry.
uint64_t count_from_stored(uint32_t stored);
uint32_t count_to_stored(size_t count, const std::string& what);

// Reads the entire content of a file into a byte vector.
Bytes read_filepath(const std::filesystem::path& path);

// Writes a byte vector to a file, replacing it.
void write_filepath(const std::filesystem::path& path, const Bytes& data);

#endif // UTILS_HPP
