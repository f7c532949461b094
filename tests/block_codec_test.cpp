#include <gtest/gtest.h>
#include <algorithm>
#include "block_codec.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

namespace {

const BlockCodec& codec_for(const std::string& ident) {
    const BlockCodec* codec = BlockCodecRegistry::instance().find(ident);
    if (codec == nullptr) {
        throw std::runtime_error("no codec registered for " + ident);
    }
    return *codec;
}

IntermediateNode decode_and_check(const std::string& ident, const Bytes& data, const FormatContext& ctx) {
    const BlockCodec& codec = codec_for(ident);
    IntermediateNode node = codec.decode(data, ctx);
    EXPECT_EQ(codec.encode(node, ctx), data) << "re-encoding " << ident;
    return node;
}

Bytes save_record_v15() {
    Bytes data = concat({be32(0x15008000), be32(0x00000200)});
    for (int i = 0; i < 112; ++i) {
        data.push_back(static_cast<uint8_t>(i * 3));
    }
    data = concat({data, Bytes(16, 0xAB), bytes_of({0x01, 0x00, 0x00, 0x00}), be32(0x11223344), bytes_of({0x7E, 0x7F})});
    return data;
}

} // namespace

TEST(BlockCodecRegistry, KnownAndUnknownTags) {
    const auto& registry = BlockCodecRegistry::instance();
    EXPECT_NE(registry.find("LVSR"), nullptr);
    EXPECT_NE(registry.find("STR "), nullptr);
    EXPECT_EQ(registry.find("ZZZZ"), nullptr);
    EXPECT_EQ(registry.find("lvsr"), nullptr);
    auto tags = registry.tags();
    for (const char* tag : {"BDPW", "FTAB", "LIvi", "LIBN", "icl8", "HBUF", "FLAG", "STRG", "CPMp", "DSIM", "LVzp"}) {
        EXPECT_NE(std::find(tags.begin(), tags.end(), tag), tags.end()) << tag;
    }
}

TEST(PassthroughCodec, KeepsBytes) {
    FormatContext ctx = make_context();
    Bytes data = bytes_of({0x00, 0xFF, 0x10});
    const BlockCodec& codec = BlockCodecRegistry::instance().passthrough();
    IntermediateNode node = codec.decode(data, ctx);
    EXPECT_EQ(node.tag, "Opaque");
    EXPECT_EQ(codec.encode(node, ctx), data);
}

TEST(PasswordCodec, ZeroHashes) {
    FormatContext ctx = make_context();
    IntermediateNode node = decode_and_check("BDPW", Bytes(48, 0), ctx);
    const std::string zeros(32, '0');
    EXPECT_EQ(node.tag, "Password");
    EXPECT_EQ(node.get("PasswordHash"), zeros);
    EXPECT_EQ(node.get("Hash1"), zeros);
    EXPECT_EQ(node.get("Hash2"), zeros);
    EXPECT_FALSE(node.payload.has_value());
}

TEST(PasswordCodec, ShortRecordKeepsRemainder) {
    FormatContext ctx = make_context();
    Bytes data(20, 0x11);
    IntermediateNode node = decode_and_check("BDPW", data, ctx);
    EXPECT_TRUE(node.has("PasswordHash"));
    EXPECT_FALSE(node.has("Hash1"));
    ASSERT_TRUE(node.payload.has_value());
    EXPECT_EQ(node.payload->size(), 4u);
}

TEST(PasswordCodec, BadHashLengthIsEncodeError) {
    FormatContext ctx = make_context();
    IntermediateNode node("Password");
    node.set("PasswordHash", "abcd");
    EXPECT_THROW(codec_for("BDPW").encode(node, ctx), EncodeError);
}

TEST(SaveRecordCodec, VersionAndProtectedFlag) {
    FormatContext ctx = make_context();
    Bytes data = bytes_of({0x08, 0x00, 0x80, 0x00, 0x00, 0x00, 0x20, 0x00});
    IntermediateNode node = decode_and_check("LVSR", data, ctx);
    const IntermediateNode& version = node.child("Version");
    EXPECT_EQ(version.get("Major"), "8");
    EXPECT_EQ(version.get("Minor"), "0");
    EXPECT_EQ(version.get("Stage"), "release");
    EXPECT_EQ(node.get("Protected"), "true");
    EXPECT_EQ(node.get("ExecFlags"), "0x00000000");

    node.set("Protected", "false");
    EXPECT_EQ(codec_for("LVSR").encode(node, ctx), bytes_of({0x08, 0x00, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST(SaveRecordCodec, VersionDependentFields) {
    FormatContext ctx = make_context();
    IntermediateNode node = decode_and_check("LVSR", save_record_v15(), ctx);
    EXPECT_EQ(node.get("Protected"), "false");
    EXPECT_EQ(node.get("ExecFlags"), "0x00000200");
    EXPECT_EQ(node.get("Field78Hash"), "abababababababababababababababab");
    EXPECT_EQ(node.get("InlineStg"), "1");
    EXPECT_EQ(node.get("Field8C"), "0x11223344");
    ASSERT_TRUE(node.payload.has_value());
    EXPECT_EQ(*node.payload, bytes_of({0x7E, 0x7F}));
}

TEST(SaveRecordCodec, NonZeroPadLeavesFieldInTail) {
    FormatContext ctx = make_context();
    Bytes data = save_record_v15();
    data[137] = 0x05;
    IntermediateNode node = decode_and_check("LVSR", data, ctx);
    EXPECT_TRUE(node.has("InlineStg"));
    EXPECT_FALSE(node.has("Field8C"));
    ASSERT_TRUE(node.payload.has_value());
    EXPECT_EQ(node.payload->size(), 9u);
}

TEST(SaveRecordCodec, OlderVersionStopsAtFixedPart) {
    FormatContext ctx = make_context();
    Bytes data = save_record_v15();
    poke32(data, 0, 0x09008000);
    IntermediateNode node = decode_and_check("LVSR", data, ctx);
    EXPECT_TRUE(node.has("Field74"));
    EXPECT_FALSE(node.has("Field78Hash"));
    ASSERT_TRUE(node.payload.has_value());
    EXPECT_EQ(node.payload->size(), data.size() - 120);
}

TEST(VersionResourceCodec, LanguageCodeVariant) {
    FormatContext ctx = make_context(ContainerLayout::Extended);
    Bytes data = concat({be32(0x08008000), be16(0x0409), pascal_of("8.0"), pascal_of("8.0 info")});
    IntermediateNode node = decode_and_check("vers", data, ctx);
    EXPECT_EQ(node.get("Language"), "1033");
    EXPECT_EQ(node.get("Text"), "8.0");
    EXPECT_EQ(node.get("Info"), "8.0 info");
}

TEST(VersionResourceCodec, PaddedVariantBeforeExtendedLayout) {
    FormatContext ctx = make_context(ContainerLayout::Legacy, 0x07008000);
    Bytes data = concat({be32(0x07008000), pascal_of("7.0"), bytes_of({0}), pascal_of("7.0"), bytes_of({0})});
    IntermediateNode node = decode_and_check("vers", data, ctx);
    EXPECT_FALSE(node.has("Language"));

    node.set_int("Language", 5);
    EXPECT_THROW(codec_for("vers").encode(node, ctx), VersionMismatchError);

    data[8] = 0x01;
    EXPECT_THROW(codec_for("vers").decode(data, ctx), FormatError);
}

TEST(FontTableCodec, RecordsThenNames) {
    FormatContext ctx = make_context();
    Bytes data = concat({be32(0x00000001), be16(0x0002), be16(1),
                         be32(0x10), be16(12), be16(0x0001), be16(0), be16(0),
                         be32(0x20), be16(9), be16(0x0000), be16(0xAAAA), be16(0),
                         pascal_of("Arial"), pascal_of("Courier")});
    IntermediateNode node = decode_and_check("FTAB", data, ctx);
    auto fonts = node.children_with("Font");
    ASSERT_EQ(fonts.size(), 2u);
    EXPECT_EQ(fonts[0]->get("Name"), "Arial");
    EXPECT_EQ(fonts[0]->get("Size"), "12");
    EXPECT_EQ(fonts[1]->get("Name"), "Courier");
    EXPECT_EQ(fonts[1]->get("Field08"), "0x0000AAAA");

    FormatContext old_ctx = make_context(ContainerLayout::Extended, 0x07008000);
    EXPECT_THROW(codec_for("FTAB").encode(node, old_ctx), VersionMismatchError);
}

TEST(FontTableCodec, ShortRecordsBeforeVersion8) {
    FormatContext ctx = make_context(ContainerLayout::Legacy, 0x07008000);
    Bytes data = concat({be32(0), be16(0), be16(0), be32(0x10), be16(12), be16(0), pascal_of("Geneva")});
    IntermediateNode node = decode_and_check("FTAB", data, ctx);
    EXPECT_FALSE(node.children.front().has("Field08"));
}

TEST(LinkInfoCodec, PaddedNames) {
    FormatContext ctx = make_context();
    Bytes data = concat({be16(3), pascal_of("Main.vi"), be32(1),
                         bytes_of("VILB"), pascal_of("lib"), be32(2),
                         pascal_of("ab"), bytes_of({0}), pascal_of("c")});
    IntermediateNode node = decode_and_check("LIvi", data, ctx);
    EXPECT_EQ(node.get("Owner"), "Main.vi");
    const IntermediateNode& link = node.child("Link");
    EXPECT_EQ(link.get("LinkType"), "VILB");
    EXPECT_EQ(link.get("Name"), "lib");
    auto qualifiers = link.children_with("Qualifier");
    ASSERT_EQ(qualifiers.size(), 2u);
    EXPECT_EQ(qualifiers[0]->get("Text"), "ab");
    EXPECT_EQ(qualifiers[1]->get("Text"), "c");

    Bytes bad_pad = data;
    bad_pad[bad_pad.size() - 3] = 0x01;
    EXPECT_THROW(codec_for("LIvi").decode(bad_pad, ctx), FormatError);
}

TEST(LinkInfoCodec, LinkTypeMustBeFourBytes) {
    FormatContext ctx = make_context();
    IntermediateNode node("LinkInfo");
    node.set_int("Version", 1);
    node.set("Owner", "x");
    node.add_child(IntermediateNode("Link")).set("LinkType", "ABC").set("Name", "n");
    EXPECT_THROW(codec_for("LIfp").encode(node, ctx), EncodeError);
}

TEST(LibraryNamesCodec, Names) {
    FormatContext ctx = make_context();
    Bytes data = concat({be32(2), pascal_of("a.lvlib"), pascal_of("b.lvlib")});
    IntermediateNode node = decode_and_check("LIBN", data, ctx);
    ASSERT_EQ(node.children.size(), 2u);
    EXPECT_EQ(node.children[1].get("Name"), "b.lvlib");
}

TEST(HistoryCodec, WholeRecordsAndTail) {
    FormatContext ctx = make_context();
    Bytes data = concat({be32(1), be32(0x5A000000), be32(0), be32(0),
                         be32(2), be32(0x5A000010), be32(0), be32(7), bytes_of({0x42})});
    IntermediateNode node = decode_and_check("HIST", data, ctx);
    ASSERT_EQ(node.children.size(), 2u);
    EXPECT_EQ(node.children[1].get("Revision"), "2");
    EXPECT_EQ(node.children[1].get("Timestamp"), "0x5A000010");
    ASSERT_TRUE(node.payload.has_value());
    EXPECT_EQ(*node.payload, bytes_of({0x42}));
}

TEST(ConnectorMapCodec, Entries) {
    FormatContext ctx = make_context();
    Bytes data = concat({bytes_of({2, 0}), be16(5), be16(0x0102)});
    IntermediateNode node = decode_and_check("CPMp", data, ctx);
    ASSERT_EQ(node.children.size(), 2u);
    EXPECT_EQ(node.children[1].get("Value"), "258");
}

TEST(MultilineTextCodec, SplitsOnDominantEoln) {
    FormatContext ctx = make_context();
    IntermediateNode node = decode_and_check("TITL", pascal_of("Line1\r\nLine2"), ctx);
    EXPECT_EQ(node.get("EOLN"), "CRLF");
    auto lines = node.children_with("Line");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]->get("Text"), "Line1");
    EXPECT_EQ(lines[1]->get("Text"), "Line2");

    EXPECT_EQ(decode_and_check("TITL", pascal_of("a\n\rb"), ctx).get("EOLN"), "LFCR");
    EXPECT_EQ(decode_and_check("TITL", pascal_of("a\rb\r"), ctx).get("EOLN"), "CR");
    IntermediateNode single = decode_and_check("TITL", pascal_of("plain"), ctx);
    EXPECT_EQ(single.get("EOLN"), "CRLF");
    EXPECT_EQ(single.children.size(), 1u);
}

TEST(MultilineTextCodec, FourByteLengthAndEdits) {
    FormatContext ctx = make_context();
    Bytes data = concat({be32(7), bytes_of("one\ntwo")});
    IntermediateNode node = decode_and_check("STRG", data, ctx);
    EXPECT_EQ(node.get("EOLN"), "LF");
    node.children[1].set("Text", "three");
    EXPECT_EQ(codec_for("STRG").encode(node, ctx), concat({be32(9), bytes_of("one\nthree")}));
}

TEST(FixedBlobCodec, SizeIsEnforced) {
    FormatContext ctx = make_context();
    IntermediateNode node = decode_and_check("icl4", Bytes(512, 0x3C), ctx);
    EXPECT_EQ(node.get("Size"), "512");
    EXPECT_THROW(codec_for("icl4").decode(Bytes(511, 0), ctx), FormatError);
    node.payload->push_back(0);
    EXPECT_THROW(codec_for("icl4").encode(node, ctx), EncodeError);
}

TEST(IntegerCodec, WidthsAndFormats) {
    FormatContext ctx = make_context();
    EXPECT_EQ(decode_and_check("FLAG", bytes_of({0x2A}), ctx).get("Value"), "0x0000002A");
    EXPECT_EQ(decode_and_check("MUID", be32(256), ctx).get("Value"), "256");
    EXPECT_EQ(decode_and_check("FPTD", be16(3), ctx).get("Value"), "3");
    EXPECT_THROW(codec_for("FPTD").decode(bytes_of({0x01}), ctx), TruncatedDataError);

    IntermediateNode node("Value");
    node.set("Value", "70000");
    EXPECT_THROW(codec_for("CONP").encode(node, ctx), EncodeError);
}

TEST(ShortStringCodec, TextOnlyInLibraries) {
    Bytes data = pascal_of("Library title");
    FormatContext lib_ctx = make_context(ContainerLayout::Extended, SAMPLE_VERSION_WORD, "LVAR");
    IntermediateNode text = decode_and_check("STR ", data, lib_ctx);
    EXPECT_EQ(text.tag, "Text");
    EXPECT_EQ(text.get("Text"), "Library title");

    FormatContext vi_ctx = make_context();
    EXPECT_EQ(decode_and_check("STR ", data, vi_ctx).tag, "Opaque");
    EXPECT_THROW(codec_for("STR ").encode(text, vi_ctx), VersionMismatchError);
}

TEST(BlobCodec, HeapAndArchive) {
    FormatContext ctx = make_context();
    EXPECT_EQ(decode_and_check("BDHc", bytes_of({1, 2, 3}), ctx).tag, "Heap");
    EXPECT_EQ(decode_and_check("LVzp", bytes_of({4, 5}), ctx).tag, "Archive");
    IntermediateNode wrong("Archive");
    wrong.payload = Bytes();
    EXPECT_THROW(codec_for("BDHc").encode(wrong, ctx), EncodeError);
}

TEST(BlockCodec, NonUtf8TextFailsOnUtf8Page) {
    FormatContext ctx = make_context();
    ctx.code_page = &code_page_by_name("utf-8");
    EXPECT_THROW(codec_for("LIBN").decode(concat({be32(1), pascal_of("\xFF")}), ctx), FormatError);
}
