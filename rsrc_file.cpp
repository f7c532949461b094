#include "rsrc_file.hpp"
#include <stdexcept>

const char* layout_name(ContainerLayout layout) {
    return layout == ContainerLayout::Legacy ? "legacy" : "extended";
}

ContainerLayout layout_from_name(const std::string& name) {
    if (name == "legacy") return ContainerLayout::Legacy;
    if (name == "extended") return ContainerLayout::Extended;
    throw std::invalid_argument("Unknown container layout: " + name);
}

const RsrcBlock* RsrcFile::find_block(const std::string& ident) const {
    for (const auto& block : this->blocks) {
        if (block.ident == ident) {
            return &block;
        }
    }
    return nullptr;
}
