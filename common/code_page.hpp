#ifndef CODE_PAGE_HPP
#define CODE_PAGE_HPP

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Maps the raw bytes of Pascal strings to UTF-8 text and back.
// Every page is passed explicitly to the codecs; there is no process-wide default.
class CodePage {
public:
    // Single-byte page: bytes below 0x80 are ASCII, the upper half comes from the table.
    CodePage(std::string name, const std::array<char32_t, 128>& upper_half);

    // UTF-8 passthrough page.
    explicit CodePage(std::string name);

    const std::string& name() const { return name_; }

    // Throws FormatError if the bytes cannot be represented as text (UTF-8 page only).
    std::string decode(const std::vector<uint8_t>& raw) const;

    // Throws EncodeError if a character has no byte in this page.
    std::vector<uint8_t> encode(const std::string& text) const;

private:
    std::string name_;
    bool utf8_;
    std::array<char32_t, 128> upper_{};
    std::unordered_map<char32_t, uint8_t> reverse_;
};

// Looks up one of the built-in pages: "utf-8", "latin1", "cp1252", "mac-roman".
// Throws std::invalid_argument for anything else.
const CodePage& code_page_by_name(const std::string& name);

std::vector<std::string> code_page_names();

constexpr const char* DEFAULT_CODE_PAGE = "mac-roman";

#endif // CODE_PAGE_HPP
