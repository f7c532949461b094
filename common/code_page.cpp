#include "code_page.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace {

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Reads one code point at pos and advances it. Returns false on malformed input.
bool next_code_point(const std::string& text, size_t& pos, char32_t& cp) {
    auto byte = [&](size_t i) { return static_cast<uint8_t>(text[i]); };
    uint8_t lead = byte(pos);
    size_t extra;
    if (lead < 0x80) {
        cp = lead;
        extra = 0;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        extra = 3;
    } else {
        return false;
    }
    if (pos + extra >= text.size()) {
        return false;
    }
    for (size_t i = 1; i <= extra; ++i) {
        uint8_t cont = byte(pos + i);
        if ((cont & 0xC0) != 0x80) {
            return false;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    static const char32_t min_value[] = {0, 0x80, 0x800, 0x10000};
    if (cp < min_value[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return false;
    }
    pos += extra + 1;
    return true;
}

bool is_valid_utf8(const std::string& text) {
    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        if (!next_code_point(text, pos, cp)) {
            return false;
        }
    }
    return true;
}

const std::array<char32_t, 128> LATIN1_UPPER = [] {
    std::array<char32_t, 128> t{};
    for (size_t i = 0; i < t.size(); ++i) {
        t[i] = static_cast<char32_t>(0x80 + i);
    }
    return t;
}();

// Bytes left undefined by Windows-1252 (0x81, 0x8D, 0x8F, 0x90, 0x9D) map to the C1 control of the same value.
const std::array<char32_t, 128> CP1252_UPPER = [] {
    std::array<char32_t, 128> t = LATIN1_UPPER;
    const char32_t c1[32] = {
        0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
        0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
        0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
        0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
    };
    for (size_t i = 0; i < 32; ++i) {
        t[i] = c1[i];
    }
    return t;
}();

const std::array<char32_t, 128> MAC_ROMAN_UPPER = {
    0x00C4, 0x00C5, 0x00C7, 0x00C9, 0x00D1, 0x00D6, 0x00DC, 0x00E1,
    0x00E0, 0x00E2, 0x00E4, 0x00E3, 0x00E5, 0x00E7, 0x00E9, 0x00E8,
    0x00EA, 0x00EB, 0x00ED, 0x00EC, 0x00EE, 0x00EF, 0x00F1, 0x00F3,
    0x00F2, 0x00F4, 0x00F6, 0x00F5, 0x00FA, 0x00F9, 0x00FB, 0x00FC,
    0x2020, 0x00B0, 0x00A2, 0x00A3, 0x00A7, 0x2022, 0x00B6, 0x00DF,
    0x00AE, 0x00A9, 0x2122, 0x00B4, 0x00A8, 0x2260, 0x00C6, 0x00D8,
    0x221E, 0x00B1, 0x2264, 0x2265, 0x00A5, 0x00B5, 0x2202, 0x2211,
    0x220F, 0x03C0, 0x222B, 0x00AA, 0x00BA, 0x03A9, 0x00E6, 0x00F8,
    0x00BF, 0x00A1, 0x00AC, 0x221A, 0x0192, 0x2248, 0x2206, 0x00AB,
    0x00BB, 0x2026, 0x00A0, 0x00C0, 0x00C3, 0x00D5, 0x0152, 0x0153,
    0x2013, 0x2014, 0x201C, 0x201D, 0x2018, 0x2019, 0x00F7, 0x25CA,
    0x00FF, 0x0178, 0x2044, 0x20AC, 0x2039, 0x203A, 0xFB01, 0xFB02,
    0x2021, 0x00B7, 0x201A, 0x201E, 0x2030, 0x00C2, 0x00CA, 0x00C1,
    0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF, 0x00CC, 0x00D3, 0x00D4,
    0xF8FF, 0x00D2, 0x00DA, 0x00DB, 0x00D9, 0x0131, 0x02C6, 0x02DC,
    0x00AF, 0x02D8, 0x02D9, 0x02DA, 0x00B8, 0x02DD, 0x02DB, 0x02C7,
};

} // namespace

CodePage::CodePage(std::string name, const std::array<char32_t, 128>& upper_half)
    : name_(std::move(name)), utf8_(false), upper_(upper_half) {
    for (size_t i = 0; i < upper_.size(); ++i) {
        reverse_.emplace(upper_[i], static_cast<uint8_t>(0x80 + i));
    }
}

CodePage::CodePage(std::string name) : name_(std::move(name)), utf8_(true) {}

std::string CodePage::decode(const std::vector<uint8_t>& raw) const {
    if (utf8_) {
        std::string text(raw.begin(), raw.end());
        if (!is_valid_utf8(text)) {
            throw FormatError("String is not valid UTF-8");
        }
        return text;
    }
    std::string text;
    text.reserve(raw.size());
    for (uint8_t b : raw) {
        append_utf8(text, b < 0x80 ? static_cast<char32_t>(b) : upper_[b - 0x80]);
    }
    return text;
}

std::vector<uint8_t> CodePage::encode(const std::string& text) const {
    if (utf8_) {
        if (!is_valid_utf8(text)) {
            throw EncodeError("String is not valid UTF-8");
        }
        return std::vector<uint8_t>(text.begin(), text.end());
    }
    std::vector<uint8_t> raw;
    raw.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp;
        if (!next_code_point(text, pos, cp)) {
            throw EncodeError("String is not valid UTF-8");
        }
        if (cp < 0x80) {
            raw.push_back(static_cast<uint8_t>(cp));
            continue;
        }
        auto it = reverse_.find(cp);
        if (it == reverse_.end()) {
            throw EncodeError("Character U+" + std::to_string(static_cast<uint32_t>(cp)) +
                              " cannot be represented in code page " + name_);
        }
        raw.push_back(it->second);
    }
    return raw;
}

const CodePage& code_page_by_name(const std::string& name) {
    static const CodePage utf8("utf-8");
    static const CodePage latin1("latin1", LATIN1_UPPER);
    static const CodePage cp1252("cp1252", CP1252_UPPER);
    static const CodePage mac_roman("mac-roman", MAC_ROMAN_UPPER);

    if (name == "utf-8" || name == "utf8") return utf8;
    if (name == "latin1" || name == "iso-8859-1") return latin1;
    if (name == "cp1252" || name == "windows-1252") return cp1252;
    if (name == "mac-roman" || name == "macroman") return mac_roman;
    throw std::invalid_argument("Unknown code page: " + name);
}

std::vector<std::string> code_page_names() {
    return {"utf-8", "latin1", "cp1252", "mac-roman"};
}
