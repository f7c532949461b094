#include <gtest/gtest.h>
#include <algorithm>
#include "rsrc_builder.hpp"
#include "rsrc_parser.hpp"
#include "test_helpers.hpp"

namespace {

Bytes build(const RsrcFile& file) {
    return RsrcBuilder(file).build();
}

uint32_t peek32(const Bytes& data, size_t pos) {
    return (static_cast<uint32_t>(data[pos]) << 24) | (static_cast<uint32_t>(data[pos + 1]) << 16) |
           (static_cast<uint32_t>(data[pos + 2]) << 8) | static_cast<uint32_t>(data[pos + 3]);
}

// Patches a header field in both copies so they stay identical.
void poke_both_headers(Bytes& data, size_t field, uint32_t value) {
    const uint32_t info_offset = peek32(data, 16);
    poke32(data, field, value);
    poke32(data, info_offset + field, value);
}

} // namespace

TEST(RsrcContainer, ExtendedLayoutRoundTrip) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    RsrcContainer container(data);
    EXPECT_EQ(container.file.layout, ContainerLayout::Extended);
    EXPECT_EQ(container.file.type, "LVIN");
    EXPECT_EQ(container.file.int1, 1u);
    EXPECT_EQ(container.file.int2, 2u);
    ASSERT_EQ(container.file.blocks.size(), 6u);
    EXPECT_EQ(container.file.blocks[1].ident, "vers");
    ASSERT_EQ(container.file.blocks[1].sections.size(), 2u);
    EXPECT_EQ(container.file.blocks[1].sections[1].index, 7);
    EXPECT_TRUE(container.warnings.empty());

    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, LegacyLayoutRoundTrip) {
    Bytes data = build(make_sample_vi(ContainerLayout::Legacy));
    RsrcContainer container(data);
    EXPECT_EQ(container.file.layout, ContainerLayout::Legacy);
    EXPECT_EQ(container.file.file_name, bytes_of("sample.vi"));
    EXPECT_EQ(container.file.blocks.size(), 6u);
    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, HeaderCopiesAreIdentical) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    const uint32_t info_offset = peek32(data, 16);
    EXPECT_TRUE(std::equal(data.begin(), data.begin() + 32, data.begin() + info_offset));
    EXPECT_EQ(peek32(data, 24), 32u);
    EXPECT_EQ(peek32(data, 28), info_offset - 32);
}

TEST(RsrcContainer, CompressedSectionsInflate) {
    RsrcFile file = make_sample_vi(ContainerLayout::Extended);
    const Bytes heap = file.blocks[4].sections[0].data;
    RsrcContainer container(build(file));
    const RsrcSection& section = container.file.blocks[4].sections[0];
    EXPECT_EQ(section.coding, SectionCoding::Zlib);
    EXPECT_EQ(section.zlib_level, DEFAULT_ZLIB_LEVEL);
    EXPECT_EQ(section.data, heap);
    EXPECT_LT(section.stored.size(), heap.size());
}

TEST(RsrcContainer, EmptyCompressedSectionStaysCompressed) {
    RsrcFile file;
    file.blocks.push_back(make_block("DFDS", {make_section(0, Bytes(), SectionCoding::Zlib)}));
    Bytes data = build(file);
    RsrcContainer container(data);
    EXPECT_TRUE(container.warnings.empty());
    const RsrcSection& section = container.file.blocks[0].sections[0];
    EXPECT_EQ(section.coding, SectionCoding::Zlib);
    EXPECT_TRUE(section.data.empty());
    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, LegacyLayoutDetectsZlibByContent) {
    RsrcFile file;
    file.layout = ContainerLayout::Legacy;
    file.blocks.push_back(make_block("ZZZZ", {make_section(0, Bytes(64, 0x61), SectionCoding::Zlib)}));
    Bytes data = build(file);
    RsrcContainer container(data);
    EXPECT_TRUE(container.warnings.empty());
    const RsrcSection& section = container.file.blocks[0].sections[0];
    EXPECT_EQ(section.coding, SectionCoding::Zlib);
    EXPECT_EQ(section.data, Bytes(64, 0x61));
    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, ExtendedLayoutOnlyInflatesKnownTags) {
    RsrcFile file;
    file.blocks.push_back(make_block("ZZZZ", {make_section(0, Bytes(64, 0x61), SectionCoding::Zlib)}));
    RsrcContainer container(build(file));
    EXPECT_EQ(container.file.blocks[0].sections[0].coding, SectionCoding::None);
}

TEST(RsrcContainer, XorCodedArchive) {
    RsrcFile file;
    file.blocks.push_back(make_block("LVzp", {make_section(0, bytes_of("PK archive"), SectionCoding::Xor)}));
    Bytes data = build(file);
    RsrcContainer container(data);
    const RsrcSection& section = container.file.blocks[0].sections[0];
    EXPECT_EQ(section.coding, SectionCoding::Xor);
    EXPECT_EQ(section.data, bytes_of("PK archive"));
    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, DamagedCompressionIsWarningAndKeepsRawBytes) {
    RsrcFile file;
    file.blocks.push_back(make_block("BDHc", {make_section(3, bytes_of({1, 2, 3, 4, 5, 6, 7, 8}))}));
    Bytes data = build(file);
    RsrcContainer container(data);
    ASSERT_EQ(container.warnings.size(), 1u);
    EXPECT_EQ(container.warnings[0].kind, WarningKind::Compression);
    EXPECT_EQ(container.warnings[0].block, "BDHc");
    EXPECT_EQ(container.warnings[0].section, 3);
    EXPECT_EQ(container.file.blocks[0].sections[0].coding, SectionCoding::None);
    EXPECT_EQ(container.file.blocks[0].sections[0].data, bytes_of({1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, SectionNamesKeepRecordedOrder) {
    RsrcFile file;
    RsrcSection first = make_section(0, bytes_of("x"));
    first.name = bytes_of("aa");
    first.name_offset = 3;
    RsrcSection second = make_section(1, bytes_of("y"));
    second.name = bytes_of("b");
    second.name_offset = 0;
    RsrcSection unnamed = make_section(2, bytes_of("z"));
    file.blocks.push_back(make_block("STR ", {first, second, unnamed}));

    Bytes data = build(file);
    RsrcContainer container(data);
    const auto& sections = container.file.blocks[0].sections;
    EXPECT_EQ(*sections[0].name, bytes_of("aa"));
    EXPECT_EQ(*sections[0].name_offset, 2u);
    EXPECT_EQ(*sections[1].name, bytes_of("b"));
    EXPECT_EQ(*sections[1].name_offset, 0u);
    EXPECT_FALSE(sections[2].name.has_value());
    EXPECT_EQ(build(container.file), data);
}

TEST(RsrcContainer, UnrecordedNamesFollowBlockOrder) {
    RsrcFile file;
    RsrcSection a = make_section(0, bytes_of("1"));
    a.name = bytes_of("first");
    RsrcSection b = make_section(0, bytes_of("2"));
    b.name = bytes_of("second");
    file.blocks.push_back(make_block("AAAA", {a}));
    file.blocks.push_back(make_block("BBBB", {b}));
    RsrcContainer container(build(file));
    EXPECT_EQ(*container.file.blocks[0].sections[0].name_offset, 0u);
    EXPECT_EQ(*container.file.blocks[1].sections[0].name_offset, 6u);
}

TEST(RsrcContainer, TooSmallForHeader) {
    EXPECT_THROW(RsrcContainer(Bytes(31, 0)), TruncatedDataError);
}

TEST(RsrcContainer, BadMagic) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    data[0] = 'X';
    EXPECT_THROW(RsrcContainer{data}, FormatError);
}

TEST(RsrcContainer, BadCreator) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    data[12] = 'X';
    EXPECT_THROW(RsrcContainer{data}, FormatError);
}

TEST(RsrcContainer, HeaderMismatch) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    const uint32_t info_offset = peek32(data, 16);
    data[info_offset + 8] = 'X';
    EXPECT_THROW(RsrcContainer{data}, FormatError);
}

TEST(RsrcContainer, InfoOffsetPastEndIsTruncation) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    poke32(data, 16, static_cast<uint32_t>(data.size()) + 100);
    try {
        RsrcContainer container(data);
        FAIL() << "expected TruncatedDataError";
    } catch (const TruncatedDataError& e) {
        ASSERT_TRUE(e.offset().has_value());
        EXPECT_EQ(*e.offset(), 16u);
    }
}

TEST(RsrcContainer, TruncatedFile) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    data.resize(data.size() - 4);
    EXPECT_THROW(RsrcContainer{data}, TruncatedDataError);
}

TEST(RsrcContainer, DataRegionOverlappingInfoIsCorrupt) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    poke_both_headers(data, 28, peek32(data, 28) + 8);
    EXPECT_THROW(RsrcContainer{data}, CorruptOffsetError);
}

TEST(RsrcContainer, InfoOffsetInsideHeaderIsCorrupt) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    poke32(data, 16, 8);
    EXPECT_THROW(RsrcContainer{data}, CorruptOffsetError);
}

TEST(RsrcContainer, SectionInfoInsideBlockHeadersIsCorrupt) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    const uint32_t blockinfo = peek32(data, 16) + 32 + 20;
    // Offset field of the second block header
    poke32(data, blockinfo + 4 + 12 + 8, 4);
    EXPECT_THROW(RsrcContainer{data}, CorruptOffsetError);
}

TEST(RsrcContainer, ExcessiveBlockCountIsCorrupt) {
    Bytes data = build(make_sample_vi(ContainerLayout::Extended));
    const uint32_t blockinfo = peek32(data, 16) + 32 + 20;
    poke32(data, blockinfo, MAX_BLOCK_COUNT + 1);
    try {
        RsrcContainer container(data);
        FAIL() << "expected CorruptOffsetError";
    } catch (const CorruptOffsetError& e) {
        ASSERT_TRUE(e.offset().has_value());
        EXPECT_EQ(*e.offset(), blockinfo);
    }
}

TEST(RsrcContainer, DuplicateSectionIndexIsCorrupt) {
    RsrcFile file;
    file.blocks.push_back(make_block("ZZZZ", {make_section(1, bytes_of("a")), make_section(1, bytes_of("b"))}));
    EXPECT_THROW(RsrcContainer{build(file)}, CorruptOffsetError);
}

TEST(RsrcContainer, SectionDataOutsideDataRegionIsCorrupt) {
    RsrcFile file;
    file.blocks.push_back(make_block("ZZZZ", {make_section(0, bytes_of("abcd"))}));
    Bytes data = build(file);
    const uint32_t info_offset = peek32(data, 16);
    // list header (20) + count (4) + one block header (12), then the section info
    const size_t section_info = info_offset + 32 + 20 + 4 + 12;
    // Points at the second header: inside the file, past the data region
    poke32(data, section_info + 12, peek32(data, 28));
    EXPECT_THROW(RsrcContainer{data}, CorruptOffsetError);
}

TEST(RsrcBuilder, RejectsWhatCannotBeStored) {
    RsrcFile empty;
    EXPECT_THROW(build(empty), EncodeError);

    RsrcFile bad_ident;
    bad_ident.blocks.push_back(make_block("TOOLONG", {make_section(0, {})}));
    EXPECT_THROW(build(bad_ident), EncodeError);

    RsrcFile empty_block;
    empty_block.blocks.push_back(make_block("ZZZZ", {}));
    EXPECT_THROW(build(empty_block), EncodeError);

    RsrcFile long_name;
    RsrcSection section = make_section(0, {});
    section.name = Bytes(256, 'n');
    long_name.blocks.push_back(make_block("ZZZZ", {section}));
    EXPECT_THROW(build(long_name), EncodeError);

    RsrcFile legacy_named;
    legacy_named.layout = ContainerLayout::Legacy;
    section.name = bytes_of("name");
    legacy_named.blocks.push_back(make_block("ZZZZ", {section}));
    EXPECT_THROW(build(legacy_named), VersionMismatchError);
}

TEST(RsrcBuilder, SectionDataIsFourByteAligned) {
    RsrcFile file;
    file.blocks.push_back(make_block("ZZZZ", {make_section(0, bytes_of("a")), make_section(1, bytes_of("bcdef"))}));
    Bytes data = build(file);
    RsrcContainer container(data);
    EXPECT_EQ(container.header.data_size % 4, 0u);
    EXPECT_EQ(container.file.blocks[0].sections[1].data, bytes_of("bcdef"));
}
