#include "block_codecs.hpp"
#include "errors.hpp"

namespace {

// Link type tags are plain four-character identifiers.
const CodePage& ident_page() {
    return code_page_by_name("latin1");
}

} // namespace

// --- FTAB ---

IntermediateNode FontTableCodec::decode(const Bytes& data, const FormatContext& ctx) const {
    ByteReader reader(data);
    IntermediateNode node("FontTable");
    node.set_hex("Flags", reader.u32());
    node.set_hex("Field04", reader.u16());
    const size_t count = static_cast<size_t>(reader.u16()) + 1;
    const bool extended = ctx.version_at_least(8);

    for (size_t i = 0; i < count; ++i) {
        IntermediateNode& font = node.add_child(IntermediateNode("Font"));
        font.set_hex("Id", reader.u32());
        font.set_int("Size", reader.u16());
        font.set_hex("Style", reader.u16());
        if (extended) {
            font.set_hex("Field08", reader.u16());
            font.set_hex("Field0A", reader.u16());
        }
    }
    // Names follow the whole record table
    for (auto& font : node.children) {
        font.set("Name", read_text(reader, ctx));
    }
    keep_tail(reader, node);
    return node;
}

Bytes FontTableCodec::encode(const IntermediateNode& node, const FormatContext& ctx) const {
    expect_tag(node, "FontTable");
    const auto fonts = node.children_with("Font");
    if (fonts.empty()) {
        throw EncodeError("Font table needs at least one font");
    }
    const bool extended = ctx.version_at_least(8);

    ByteWriter writer;
    writer.u32(node.get_uint("Flags", 0xFFFFFFFF));
    writer.u16(node.get_uint("Field04", 0xFFFF));
    writer.u16(fonts.size() - 1);
    for (const IntermediateNode* font : fonts) {
        writer.u32(font->get_uint("Id", 0xFFFFFFFF));
        writer.u16(font->get_uint("Size", 0xFFFF));
        writer.u16(font->get_uint("Style", 0xFFFF));
        if (extended) {
            writer.u16(font->get_uint("Field08", 0xFFFF));
            writer.u16(font->get_uint("Field0A", 0xFFFF));
        } else if (font->has("Field08") || font->has("Field0A")) {
            throw VersionMismatchError("Font records before LabVIEW 8 have no Field08/Field0A");
        }
    }
    for (const IntermediateNode* font : fonts) {
        write_text(writer, font->get("Name"), ctx);
    }
    write_tail(writer, node);
    return writer.take();
}

// --- LIvi, LIfp, LIbd, LIds ---

IntermediateNode LinkInfoCodec::decode(const Bytes& data, const FormatContext& ctx) const {
    ByteReader reader(data);
    IntermediateNode node("LinkInfo");
    node.set_int("Version", reader.u16());
    node.set("Owner", read_padded_text(reader, ctx));

    const uint32_t count = reader.u32();
    for (uint32_t i = 0; i < count; ++i) {
        IntermediateNode& link = node.add_child(IntermediateNode("Link"));
        link.set("LinkType", ident_page().decode(reader.bytes(4)));
        link.set("Name", read_padded_text(reader, ctx));
        const uint32_t qualifiers = reader.u32();
        for (uint32_t q = 0; q < qualifiers; ++q) {
            link.add_child(IntermediateNode("Qualifier")).set("Text", read_padded_text(reader, ctx));
        }
    }
    keep_tail(reader, node);
    return node;
}

Bytes LinkInfoCodec::encode(const IntermediateNode& node, const FormatContext& ctx) const {
    expect_tag(node, "LinkInfo");
    ByteWriter writer;
    writer.u16(node.get_uint("Version", 0xFFFF));
    write_padded_text(writer, node.get("Owner"), ctx);

    const auto links = node.children_with("Link");
    writer.u32(links.size());
    for (const IntermediateNode* link : links) {
        Bytes link_type = ident_page().encode(link->get("LinkType"));
        if (link_type.size() != 4) {
            throw EncodeError("Link type '" + link->get("LinkType") + "' is not 4 bytes long");
        }
        writer.bytes(link_type);
        write_padded_text(writer, link->get("Name"), ctx);
        const auto qualifiers = link->children_with("Qualifier");
        writer.u32(qualifiers.size());
        for (const IntermediateNode* qualifier : qualifiers) {
            write_padded_text(writer, qualifier->get("Text"), ctx);
        }
    }
    write_tail(writer, node);
    return writer.take();
}

// --- LIBN ---

IntermediateNode LibraryNamesCodec::decode(const Bytes& data, const FormatContext& ctx) const {
    ByteReader reader(data);
    IntermediateNode node("LibraryNames");
    const uint32_t count = reader.u32();
    for (uint32_t i = 0; i < count; ++i) {
        node.add_child(IntermediateNode("Library")).set("Name", read_text(reader, ctx));
    }
    keep_tail(reader, node);
    return node;
}

Bytes LibraryNamesCodec::encode(const IntermediateNode& node, const FormatContext& ctx) const {
    expect_tag(node, "LibraryNames");
    const auto libraries = node.children_with("Library");
    ByteWriter writer;
    writer.u32(libraries.size());
    for (const IntermediateNode* library : libraries) {
        write_text(writer, library->get("Name"), ctx);
    }
    write_tail(writer, node);
    return writer.take();
}

// --- HIST, HBUF ---

namespace {

constexpr size_t HISTORY_RECORD_SIZE = 16;

} // namespace

IntermediateNode HistoryCodec::decode(const Bytes& data, const FormatContext&) const {
    ByteReader reader(data);
    IntermediateNode node("History");
    const size_t count = data.size() / HISTORY_RECORD_SIZE;
    for (size_t i = 0; i < count; ++i) {
        IntermediateNode& revision = node.add_child(IntermediateNode("Revision"));
        revision.set_int("Revision", reader.u32());
        revision.set_hex("Timestamp", reader.u32());
        revision.set_hex("Field08", reader.u32());
        revision.set_hex("Field0C", reader.u32());
    }
    keep_tail(reader, node);
    return node;
}

Bytes HistoryCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, "History");
    ByteWriter writer;
    for (const IntermediateNode* revision : node.children_with("Revision")) {
        writer.u32(revision->get_uint("Revision", 0xFFFFFFFF));
        writer.u32(revision->get_uint("Timestamp", 0xFFFFFFFF));
        writer.u32(revision->get_uint("Field08", 0xFFFFFFFF));
        writer.u32(revision->get_uint("Field0C", 0xFFFFFFFF));
    }
    write_tail(writer, node);
    return writer.take();
}

// --- CPMp ---

IntermediateNode ConnectorMapCodec::decode(const Bytes& data, const FormatContext&) const {
    ByteReader reader(data);
    IntermediateNode node("ConnectorMap");
    const uint8_t count = reader.u8();
    node.set_int("Field1", reader.u8());
    for (uint8_t i = 0; i < count; ++i) {
        node.add_child(IntermediateNode("Entry")).set_int("Value", reader.u16());
    }
    keep_tail(reader, node);
    return node;
}

Bytes ConnectorMapCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, "ConnectorMap");
    const auto entries = node.children_with("Entry");
    ByteWriter writer;
    writer.u8(entries.size());
    writer.u8(node.get_uint("Field1", 0xFF));
    for (const IntermediateNode* entry : entries) {
        writer.u16(entry->get_uint("Value", 0xFFFF));
    }
    write_tail(writer, node);
    return writer.take();
}
