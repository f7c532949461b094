#include "format_context.hpp"
#include "errors.hpp"
#include <cstdlib>

namespace {

const char* const VERSION_BLOCKS[] = {"LVSR", "LVIN", "vers"};

template<typename T, typename IndexOf>
const T* lowest_section(const std::vector<T>& sections, IndexOf index_of) {
    const T* best = nullptr;
    long long best_abs = 0;
    for (const auto& section : sections) {
        long long idx = std::llabs(static_cast<long long>(index_of(section)));
        if (best == nullptr || idx < best_abs) {
            best = &section;
            best_abs = idx;
        }
    }
    return best;
}

uint32_t read_version_word(const Bytes& data) {
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

std::optional<LvVersion> version_from_content(const IntermediateNode& content) {
    if (const IntermediateNode* v = content.find_child("Version")) {
        return version_from_node(*v);
    }
    if (content.payload.has_value() && content.payload->size() >= 4) {
        return LvVersion::decode(read_version_word(*content.payload));
    }
    return std::nullopt;
}

} // namespace

const CodePage& FormatContext::text() const {
    if (this->code_page == nullptr) {
        return code_page_by_name(DEFAULT_CODE_PAGE);
    }
    return *this->code_page;
}

bool FormatContext::version_at_least(uint32_t major, uint32_t minor, VersionStage stage, uint32_t bugfix) const {
    return this->version.has_value() && this->version->is_greater_or_eq(major, minor, stage, bugfix);
}

FormatContext resolve_format(const RsrcFile& file, const CodePage& code_page) {
    FormatContext ctx;
    ctx.layout = file.layout;
    ctx.file_type = file.type;
    ctx.code_page = &code_page;

    for (const char* ident : VERSION_BLOCKS) {
        for (const RsrcBlock& block : file.blocks) {
            if (block.ident != ident) {
                continue;
            }
            const RsrcSection* section = lowest_section(block.sections, [](const RsrcSection& s) { return s.index; });
            if (section != nullptr && section->data.size() >= 4) {
                ctx.version = LvVersion::decode(read_version_word(section->data));
                return ctx;
            }
        }
    }
    return ctx;
}

FormatContext resolve_format(const IntermediateNode& root, ContainerLayout layout, const CodePage& code_page) {
    FormatContext ctx;
    ctx.layout = layout;
    ctx.file_type = root.get_or("Type", "");
    ctx.code_page = &code_page;

    for (const char* ident : VERSION_BLOCKS) {
        for (const IntermediateNode* block : root.children_with("Block")) {
            if (block->get_or("Ident", "") != ident) {
                continue;
            }
            std::vector<IntermediateNode> sections;
            for (const IntermediateNode* s : block->children_with("Section")) {
                sections.push_back(*s);
            }
            const IntermediateNode* section = lowest_section(sections, [](const IntermediateNode& s) {
                return s.get_int_or("Index", 0);
            });
            if (section == nullptr || section->children.empty()) {
                continue;
            }
            std::optional<LvVersion> version = version_from_content(section->children.front());
            if (version.has_value()) {
                ctx.version = version;
                return ctx;
            }
        }
    }
    return ctx;
}

IntermediateNode version_to_node(const LvVersion& version) {
    IntermediateNode node("Version");
    node.set_int("Major", version.major);
    node.set_int("Minor", version.minor);
    node.set_int("Bugfix", version.bugfix);
    node.set("Stage", stage_name(version.stage));
    node.set_int("Flags", version.flags);
    node.set_int("Build", version.build);
    return node;
}

LvVersion version_from_node(const IntermediateNode& node) {
    LvVersion version;
    version.major = static_cast<uint32_t>(node.get_uint("Major", 99));
    version.minor = static_cast<uint32_t>(node.get_uint("Minor", 0x0F));
    version.bugfix = static_cast<uint32_t>(node.get_uint("Bugfix", 0x0F));
    try {
        version.stage = stage_from_name(node.get("Stage"));
    } catch (const std::logic_error&) {
        throw EncodeError("Unknown version stage '" + node.get("Stage") + "'");
    }
    version.flags = static_cast<uint32_t>(node.get_uint("Flags", 0x1F));
    version.build = static_cast<uint32_t>(node.get_uint("Build", 99));
    return version;
}
