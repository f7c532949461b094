#ifndef VERSION_HPP
#define VERSION_HPP

#include <cstdint>
#include <string>

enum class VersionStage : uint8_t {
    Unknown = 0,
    Development = 1,
    Alpha = 2,
    Beta = 3,
    Release = 4
};

// Packed 32-bit version word as found in LVSR, LVIN and vers blocks.
//   bits 24-31  major, two BCD digits
//   bits 20-23  minor
//   bits 16-19  bugfix
//   bits 13-15  stage
//   bits  8-12  flags
//   bits  0-7   build, two BCD digits
struct LvVersion {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t bugfix = 0;
    uint32_t stage = 0;
    uint32_t flags = 0;
    uint32_t build = 0;

    static LvVersion decode(uint32_t word);

    // Throws EncodeError when a component is out of range for its slot.
    uint32_t encode() const;

    // Stage is compared before bugfix, matching how the environment orders its releases.
    bool is_greater_or_eq(uint32_t major, uint32_t minor = 0, VersionStage stage = VersionStage::Unknown,
                          uint32_t bugfix = 0) const;

    std::string to_string() const;
};

// Exec flag in LVSR marking a password protected VI.
constexpr uint32_t EXEC_FLAG_PROTECTED = 0x2000;

// "release", "beta", ... or the decimal value for stages 5-7.
std::string stage_name(uint32_t stage);

// Accepts a stage name or a decimal number. Throws std::invalid_argument otherwise.
uint32_t stage_from_name(const std::string& name);

#endif // VERSION_HPP
