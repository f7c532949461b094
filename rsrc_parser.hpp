#ifndef RSRC_PARSER_HPP
#define RSRC_PARSER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "errors.hpp"
#include "rsrc_file.hpp"
#include "shared_structure.hpp"
#include "utils.hpp"

// One parsed RSRC container. Construction either yields a complete model or throws
// FormatError, TruncatedDataError or CorruptOffsetError; nothing partial survives.
class RsrcContainer {
public:
    RsrcHeaderRaw header{};     // host byte order, identical for both copies
    uint32_t blockinfo_size = 0;
    RsrcFile file;
    std::vector<DecodeWarning> warnings;

    explicit RsrcContainer(const Bytes& data);
    void print_info(bool verbose) const;

private:
    void read_headers(const Bytes& data);
    ContainerLayout detect_layout(const Bytes& data) const;
    void read_block_info(const Bytes& data);
    void read_section_payload(const Bytes& data, const std::string& ident, uint32_t data_offset, RsrcSection& section);
    void read_section_names(const Bytes& data, size_t names_start);
};

// Tags whose sections are always zlib coded.
bool is_compressed_tag(const std::string& ident);

#endif // RSRC_PARSER_HPP
