#include <gtest/gtest.h>
#include "code_page.hpp"
#include "format_context.hpp"
#include "rsrc_codec.hpp"
#include "test_helpers.hpp"
#include "version.hpp"

TEST(LvVersion, DecodesPackedWord) {
    LvVersion v = LvVersion::decode(0x14008003);
    EXPECT_EQ(v.major, 14u);
    EXPECT_EQ(v.minor, 0u);
    EXPECT_EQ(v.bugfix, 0u);
    EXPECT_EQ(v.stage, static_cast<uint32_t>(VersionStage::Release));
    EXPECT_EQ(v.flags, 0u);
    EXPECT_EQ(v.build, 3u);
    EXPECT_EQ(v.encode(), 0x14008003u);
}

TEST(LvVersion, MinorAndBugfixNibbles) {
    LvVersion v = LvVersion::decode(0x08626012);
    EXPECT_EQ(v.major, 8u);
    EXPECT_EQ(v.minor, 6u);
    EXPECT_EQ(v.bugfix, 2u);
    EXPECT_EQ(v.stage, static_cast<uint32_t>(VersionStage::Beta));
    EXPECT_EQ(v.build, 12u);
    EXPECT_EQ(v.encode(), 0x08626012u);
}

TEST(LvVersion, StageComparesBeforeBugfix) {
    LvVersion beta = LvVersion::decode(0x10026000);   // 10.0.2 beta
    EXPECT_TRUE(beta.is_greater_or_eq(10));
    EXPECT_FALSE(beta.is_greater_or_eq(10, 0, VersionStage::Release));
    EXPECT_TRUE(beta.is_greater_or_eq(10, 0, VersionStage::Beta, 1));
    EXPECT_FALSE(beta.is_greater_or_eq(11));
    EXPECT_TRUE(LvVersion::decode(0x15008000).is_greater_or_eq(14, 0, VersionStage::Release, 5));
}

TEST(LvVersion, OutOfRangeComponentsRefuseToEncode) {
    LvVersion v;
    v.major = 100;
    EXPECT_THROW(v.encode(), EncodeError);
    v.major = 8;
    v.minor = 16;
    EXPECT_THROW(v.encode(), EncodeError);
}

TEST(LvVersion, StageNames) {
    EXPECT_EQ(stage_name(4), "release");
    EXPECT_EQ(stage_name(6), "6");
    EXPECT_EQ(stage_from_name("alpha"), 2u);
    EXPECT_EQ(stage_from_name("6"), 6u);
    EXPECT_THROW(stage_from_name("gamma"), std::invalid_argument);
}

TEST(ResolveFormat, PrefersSaveRecordAndLowestSectionIndex) {
    RsrcFile file;
    file.blocks.push_back(make_block("vers", {make_section(0, be32(0x07008000))}));
    file.blocks.push_back(make_block("LVSR", {make_section(5, be32(0x12008000)), make_section(-1, be32(0x11008000))}));
    FormatContext ctx = resolve_format(file, code_page_by_name("latin1"));
    ASSERT_TRUE(ctx.version.has_value());
    EXPECT_EQ(ctx.version->major, 11u);
    EXPECT_EQ(ctx.file_type, "LVIN");
}

TEST(ResolveFormat, FallsBackToVersionResource) {
    RsrcFile file;
    file.blocks.push_back(make_block("vers", {make_section(0, be32(0x07008000))}));
    FormatContext ctx = resolve_format(file, code_page_by_name("latin1"));
    ASSERT_TRUE(ctx.version.has_value());
    EXPECT_EQ(ctx.version->major, 7u);
}

TEST(ResolveFormat, NoVersionBlock) {
    RsrcFile file;
    file.blocks.push_back(make_block("ZZZZ", {make_section(0, be32(0x07008000))}));
    FormatContext ctx = resolve_format(file, code_page_by_name("latin1"));
    EXPECT_FALSE(ctx.version.has_value());
    EXPECT_FALSE(ctx.version_at_least(0));
}

TEST(ResolveFormat, TreeAgreesWithContainer) {
    RsrcFile file = make_sample_vi(ContainerLayout::Extended);
    const CodePage& page = code_page_by_name("mac-roman");
    DecodeResult decoded = file_to_tree(file, page);
    FormatContext from_file = resolve_format(file, page);
    FormatContext from_tree = resolve_format(decoded.tree, ContainerLayout::Legacy, page);
    ASSERT_TRUE(from_tree.version.has_value());
    EXPECT_EQ(from_tree.version->encode(), from_file.version->encode());
    EXPECT_EQ(from_tree.layout, ContainerLayout::Legacy);
    EXPECT_EQ(from_tree.file_type, "LVIN");
}

TEST(ResolveFormat, SkipsShortRecordForLaterBlockWithSameTag) {
    RsrcFile file;
    file.blocks.push_back(make_block("LVSR", {make_section(0, bytes_of({0x12, 0x00}))}));
    file.blocks.push_back(make_block("LVSR", {make_section(1, concat({be32(0x12008000), be32(0)}))}));
    file.blocks.push_back(make_block("vers", {make_section(0, be32(0x07008000))}));
    const CodePage& page = code_page_by_name("mac-roman");
    FormatContext from_file = resolve_format(file, page);
    ASSERT_TRUE(from_file.version.has_value());
    EXPECT_EQ(from_file.version->major, 12u);

    DecodeResult decoded = file_to_tree(file, page);
    FormatContext from_tree = resolve_format(decoded.tree, ContainerLayout::Extended, page);
    ASSERT_TRUE(from_tree.version.has_value());
    EXPECT_EQ(from_tree.version->encode(), from_file.version->encode());
}
