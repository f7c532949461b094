#include "version.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <sstream>
#include <stdexcept>

namespace {

uint32_t decode_bcd(uint32_t byte) {
    return ((byte >> 4) & 0x0F) * 10 + (byte & 0x0F);
}

uint32_t encode_bcd(uint32_t value, const char* what) {
    if (value > 99) {
        throw EncodeError(std::string("Version ") + what + " " + std::to_string(value) + " exceeds two BCD digits");
    }
    return ((value / 10) << 4) | (value % 10);
}

void check_range(uint32_t value, uint32_t max, const char* what) {
    if (value > max) {
        throw EncodeError(std::string("Version ") + what + " " + std::to_string(value) + " does not fit its bit field");
    }
}

const char* const STAGE_NAMES[] = {"unknown", "development", "alpha", "beta", "release"};

} // namespace

LvVersion LvVersion::decode(uint32_t word) {
    LvVersion v;
    v.major = decode_bcd((word >> 24) & 0xFF);
    v.minor = (word >> 20) & 0x0F;
    v.bugfix = (word >> 16) & 0x0F;
    v.stage = (word >> 13) & 0x07;
    v.flags = (word >> 8) & 0x1F;
    v.build = decode_bcd(word & 0xFF);
    return v;
}

uint32_t LvVersion::encode() const {
    check_range(this->minor, 0x0F, "minor");
    check_range(this->bugfix, 0x0F, "bugfix");
    check_range(this->stage, 0x07, "stage");
    check_range(this->flags, 0x1F, "flags");
    uint32_t word = 0;
    word |= encode_bcd(this->major, "major") << 24;
    word |= this->minor << 20;
    word |= this->bugfix << 16;
    word |= this->stage << 13;
    word |= this->flags << 8;
    word |= encode_bcd(this->build, "build");
    return word;
}

bool LvVersion::is_greater_or_eq(uint32_t major, uint32_t minor, VersionStage stage, uint32_t bugfix) const {
    if (this->major != major) return this->major > major;
    if (this->minor != minor) return this->minor > minor;
    uint32_t s = static_cast<uint32_t>(stage);
    if (this->stage != s) return this->stage > s;
    return this->bugfix >= bugfix;
}

std::string LvVersion::to_string() const {
    std::ostringstream oss;
    oss << this->major << "." << this->minor;
    if (this->bugfix != 0) {
        oss << "." << this->bugfix;
    }
    oss << " " << stage_name(this->stage) << " build " << this->build;
    return oss.str();
}

std::string stage_name(uint32_t stage) {
    if (stage < sizeof(STAGE_NAMES) / sizeof(STAGE_NAMES[0])) {
        return STAGE_NAMES[stage];
    }
    return std::to_string(stage);
}

uint32_t stage_from_name(const std::string& name) {
    for (uint32_t i = 0; i < sizeof(STAGE_NAMES) / sizeof(STAGE_NAMES[0]); ++i) {
        if (name == STAGE_NAMES[i]) {
            return i;
        }
    }
    return static_cast<uint32_t>(parse_integer(name));
}
