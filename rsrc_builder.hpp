#ifndef RSRC_BUILDER_HPP
#define RSRC_BUILDER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include "rsrc_file.hpp"
#include "utils.hpp"

// Serializes an RsrcFile in its requested layout. Fails with EncodeError or
// VersionMismatchError before any output is produced.
class RsrcBuilder {
public:
    explicit RsrcBuilder(const RsrcFile& file) : file(file) {}

    Bytes build() const;
    void build(const std::filesystem::path& output_path) const;

private:
    const RsrcFile& file;

    void validate() const;
    Bytes section_payload(const RsrcBlock& block, const RsrcSection& section) const;

    // Fills name_offsets[block][section] and returns the packed name table.
    Bytes build_name_table(std::vector<std::vector<uint32_t>>& name_offsets) const;
};

#endif // RSRC_BUILDER_HPP
