#ifndef FORMAT_CONTEXT_HPP
#define FORMAT_CONTEXT_HPP

#include <optional>
#include <string>
#include "code_page.hpp"
#include "intermediate_node.hpp"
#include "rsrc_file.hpp"
#include "version.hpp"

// Everything a block codec may branch on. Built once per file and passed explicitly.
struct FormatContext {
    ContainerLayout layout = ContainerLayout::Extended;
    std::optional<LvVersion> version;
    std::string file_type;
    const CodePage* code_page = nullptr;

    const CodePage& text() const;

    // False when no version record was found.
    bool version_at_least(uint32_t major, uint32_t minor = 0, VersionStage stage = VersionStage::Unknown,
                          uint32_t bugfix = 0) const;
};

// Version from LVSR, then LVIN, then vers; each block's lowest-numbered section is used.
FormatContext resolve_format(const RsrcFile& file, const CodePage& code_page);

// Same resolution over a decoded tree whose container will be written with the given layout.
FormatContext resolve_format(const IntermediateNode& root, ContainerLayout layout, const CodePage& code_page);

// Version child node shared by LVSR, LVIN and vers content.
IntermediateNode version_to_node(const LvVersion& version);
LvVersion version_from_node(const IntermediateNode& node);

#endif // FORMAT_CONTEXT_HPP
