#ifndef RSRC_CODEC_HPP
#define RSRC_CODEC_HPP

#include <optional>
#include <string>
#include <vector>
#include "code_page.hpp"
#include "errors.hpp"
#include "intermediate_node.hpp"
#include "rsrc_file.hpp"
#include "utils.hpp"

struct DecodeResult {
    IntermediateNode tree;
    std::vector<DecodeWarning> warnings;
};

// Bytes -> tree. Structural damage throws; content the typed codecs cannot
// reproduce is kept as an "Opaque" node and reported as a warning.
DecodeResult decode_rsrc(const Bytes& data, const CodePage& code_page);
DecodeResult file_to_tree(const RsrcFile& file, const CodePage& code_page);

// Tree -> bytes in the requested layout. Throws EncodeError or VersionMismatchError.
Bytes encode_rsrc(const IntermediateNode& root, ContainerLayout layout, const CodePage& code_page);

// Same, with the layout recorded in the root's "Layout" attribute.
Bytes encode_rsrc(const IntermediateNode& root, const CodePage& code_page);

RsrcFile tree_to_file(const IntermediateNode& root, ContainerLayout layout, const CodePage& code_page);
ContainerLayout tree_layout(const IntermediateNode& root);

// Raw string bytes as a text attribute, or as "<key>Hex" when the page cannot represent them.
void set_text_attr(IntermediateNode& node, const std::string& key, const Bytes& raw, const CodePage& code_page);
std::optional<Bytes> get_text_attr(const IntermediateNode& node, const std::string& key, const CodePage& code_page);

#endif // RSRC_CODEC_HPP
