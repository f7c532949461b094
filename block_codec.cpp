#include "block_codec.hpp"
#include "block_codecs.hpp"
#include "errors.hpp"
#include <algorithm>

std::string read_text(ByteReader& reader, const FormatContext& ctx, size_t length_width) {
    return ctx.text().decode(reader.pascal(length_width));
}

void write_text(ByteWriter& writer, const std::string& text, const FormatContext& ctx, size_t length_width) {
    writer.pascal(ctx.text().encode(text), length_width);
}

std::string read_padded_text(ByteReader& reader, const FormatContext& ctx) {
    const size_t pos = reader.absolute();
    Bytes raw = reader.pascal();
    if (raw.size() % 2 == 0 && reader.u8() != 0) {
        throw FormatError("Non-zero padding after string", pos + 1 + raw.size());
    }
    return ctx.text().decode(raw);
}

void write_padded_text(ByteWriter& writer, const std::string& text, const FormatContext& ctx) {
    Bytes raw = ctx.text().encode(text);
    writer.pascal(raw);
    if (raw.size() % 2 == 0) {
        writer.u8(0);
    }
}

Bytes hex_attribute(const IntermediateNode& node, const std::string& key, size_t size) {
    Bytes value;
    try {
        value = unhexlify(node.get(key));
    } catch (const std::invalid_argument& e) {
        throw EncodeError("Attribute '" + key + "' of node '" + node.tag + "': " + e.what());
    }
    if (value.size() != size) {
        throw EncodeError("Attribute '" + key + "' of node '" + node.tag + "' must hold " + std::to_string(size) +
                          " bytes, has " + std::to_string(value.size()));
    }
    return value;
}

bool bool_attribute(const IntermediateNode& node, const std::string& key) {
    const std::string& value = node.get(key);
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw EncodeError("Attribute '" + key + "' of node '" + node.tag + "' is not a boolean: '" + value + "'");
}

void keep_tail(ByteReader& reader, IntermediateNode& node) {
    if (!reader.at_end()) {
        node.payload = reader.rest();
    }
}

void write_tail(ByteWriter& writer, const IntermediateNode& node) {
    if (node.payload.has_value()) {
        writer.bytes(*node.payload);
    }
}

void expect_tag(const IntermediateNode& node, const char* tag) {
    if (node.tag != tag) {
        throw EncodeError(std::string("Expected '") + tag + "' content node, found '" + node.tag + "'");
    }
}

// --- Passthrough ---

IntermediateNode PassthroughCodec::decode(const Bytes& data, const FormatContext&) const {
    IntermediateNode node(NODE_TAG);
    node.payload = data;
    return node;
}

Bytes PassthroughCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, NODE_TAG);
    return node.require_payload();
}

// --- Blobs ---

IntermediateNode BlobCodec::decode(const Bytes& data, const FormatContext&) const {
    IntermediateNode node(this->node_tag);
    node.payload = data;
    return node;
}

Bytes BlobCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, this->node_tag);
    return node.require_payload();
}

IntermediateNode FixedBlobCodec::decode(const Bytes& data, const FormatContext&) const {
    if (data.size() != this->size) {
        throw FormatError("Bitmap holds " + std::to_string(data.size()) + " bytes, expected " +
                          std::to_string(this->size));
    }
    IntermediateNode node("Bitmap");
    node.set_int("Size", static_cast<long long>(this->size));
    node.payload = data;
    return node;
}

Bytes FixedBlobCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, "Bitmap");
    const Bytes& data = node.require_payload();
    if (data.size() != this->size) {
        throw EncodeError("Bitmap must hold " + std::to_string(this->size) + " bytes, has " +
                          std::to_string(data.size()));
    }
    return data;
}

// --- Single integer ---

IntermediateNode IntegerCodec::decode(const Bytes& data, const FormatContext&) const {
    ByteReader reader(data);
    uint32_t value = 0;
    switch (this->width) {
        case 1: value = reader.u8(); break;
        case 2: value = reader.u16(); break;
        default: value = reader.u32(); break;
    }
    IntermediateNode node("Value");
    if (this->hex) {
        node.set_hex("Value", value);
    } else {
        node.set_int("Value", value);
    }
    keep_tail(reader, node);
    return node;
}

Bytes IntegerCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, "Value");
    ByteWriter writer;
    switch (this->width) {
        case 1: writer.u8(node.get_uint("Value", 0xFF)); break;
        case 2: writer.u16(node.get_uint("Value", 0xFFFF)); break;
        default: writer.u32(node.get_uint("Value", 0xFFFFFFFF)); break;
    }
    write_tail(writer, node);
    return writer.take();
}

// --- Multi-line text ---

namespace {

struct Eoln {
    const char* name;
    const char* bytes;
};

const Eoln EOLNS[] = {{"CRLF", "\r\n"}, {"LFCR", "\n\r"}, {"LF", "\n"}, {"CR", "\r"}};

size_t count_occurrences(const Bytes& data, const std::string& needle) {
    size_t count = 0;
    auto it = data.begin();
    while (true) {
        it = std::search(it, data.end(), needle.begin(), needle.end());
        if (it == data.end()) {
            return count;
        }
        ++count;
        it += static_cast<std::ptrdiff_t>(needle.size());
    }
}

const Eoln& detect_eoln(const Bytes& data) {
    size_t crlf = count_occurrences(data, "\r\n");
    size_t lfcr = count_occurrences(data, "\n\r");
    size_t lf = count_occurrences(data, "\n");
    size_t cr = count_occurrences(data, "\r");
    if (crlf > lfcr) return EOLNS[0];
    if (lfcr > 0) return EOLNS[1];
    if (lf > cr) return EOLNS[2];
    if (cr > 0) return EOLNS[3];
    return EOLNS[0];
}

const Eoln& eoln_by_name(const std::string& name) {
    for (const auto& eoln : EOLNS) {
        if (name == eoln.name) {
            return eoln;
        }
    }
    throw EncodeError("Unknown end-of-line style '" + name + "'");
}

} // namespace

IntermediateNode MultilineTextCodec::decode(const Bytes& data, const FormatContext& ctx) const {
    ByteReader reader(data);
    Bytes raw = reader.pascal(this->length_width);
    const Eoln& eoln = detect_eoln(raw);
    const std::string sep(eoln.bytes);

    IntermediateNode node("Text");
    node.set("EOLN", eoln.name);
    auto start = raw.begin();
    while (true) {
        auto end = std::search(start, raw.end(), sep.begin(), sep.end());
        IntermediateNode line("Line");
        line.set("Text", ctx.text().decode(Bytes(start, end)));
        node.add_child(std::move(line));
        if (end == raw.end()) {
            break;
        }
        start = end + static_cast<std::ptrdiff_t>(sep.size());
    }
    keep_tail(reader, node);
    return node;
}

Bytes MultilineTextCodec::encode(const IntermediateNode& node, const FormatContext& ctx) const {
    expect_tag(node, "Text");
    const std::string sep(eoln_by_name(node.get("EOLN")).bytes);
    Bytes joined;
    bool first = true;
    for (const IntermediateNode* line : node.children_with("Line")) {
        if (!first) {
            joined.insert(joined.end(), sep.begin(), sep.end());
        }
        Bytes raw = ctx.text().encode(line->get("Text"));
        joined.insert(joined.end(), raw.begin(), raw.end());
        first = false;
    }
    ByteWriter writer;
    writer.pascal(joined, this->length_width);
    write_tail(writer, node);
    return writer.take();
}

// --- 'STR ' ---

IntermediateNode ShortStringCodec::decode(const Bytes& data, const FormatContext& ctx) const {
    if (ctx.file_type != "LVAR") {
        return PassthroughCodec().decode(data, ctx);
    }
    ByteReader reader(data);
    IntermediateNode node("Text");
    node.set("Text", read_text(reader, ctx));
    keep_tail(reader, node);
    return node;
}

Bytes ShortStringCodec::encode(const IntermediateNode& node, const FormatContext& ctx) const {
    if (node.tag == PassthroughCodec::NODE_TAG) {
        return PassthroughCodec().encode(node, ctx);
    }
    expect_tag(node, "Text");
    if (ctx.file_type != "LVAR") {
        throw VersionMismatchError("Text form of 'STR ' exists only in LVAR files, not in " + ctx.file_type);
    }
    ByteWriter writer;
    write_text(writer, node.get("Text"), ctx);
    write_tail(writer, node);
    return writer.take();
}

// --- Registry ---

template<typename Codec, typename... Args>
void BlockCodecRegistry::add(std::initializer_list<const char*> idents, Args&&... args) {
    std::shared_ptr<const BlockCodec> codec = std::make_shared<Codec>(std::forward<Args>(args)...);
    for (const char* ident : idents) {
        this->codecs[ident] = codec;
    }
}

BlockCodecRegistry::BlockCodecRegistry() {
    add<SaveRecordCodec>({"LVSR", "LVIN"});
    add<VersionResourceCodec>({"vers"});
    add<PasswordCodec>({"BDPW"});
    add<FontTableCodec>({"FTAB"});
    add<LinkInfoCodec>({"LIvi", "LIfp", "LIbd", "LIds"});
    add<LibraryNamesCodec>({"LIBN"});
    add<FixedBlobCodec>({"icl8"}, 1024);
    add<FixedBlobCodec>({"icl4"}, 512);
    add<FixedBlobCodec>({"ICON"}, 128);
    add<HistoryCodec>({"HIST", "HBUF"});
    add<IntegerCodec>({"MUID", "FPSE", "BDSE"}, 4, false);
    add<IntegerCodec>({"FPTD", "CONP", "CPC2"}, 2, false);
    add<IntegerCodec>({"FLAG"}, 1, true);
    add<MultilineTextCodec>({"TITL"}, 1);
    add<MultilineTextCodec>({"STRG"}, 4);
    add<ShortStringCodec>({"STR "});
    add<ConnectorMapCodec>({"CPMp"});
    add<BlobCodec>({"BDHc", "BDHb", "FPHc", "FPHb", "BDHP", "VCTP", "DFDS", "GCDI", "DSIM", "TM80", "BDHX", "FPHX"},
                   "Heap");
    add<BlobCodec>({"LVzp"}, "Archive");
}

const BlockCodecRegistry& BlockCodecRegistry::instance() {
    static const BlockCodecRegistry registry;
    return registry;
}

const BlockCodec* BlockCodecRegistry::find(const std::string& ident) const {
    auto it = this->codecs.find(ident);
    return it == this->codecs.end() ? nullptr : it->second.get();
}

std::vector<std::string> BlockCodecRegistry::tags() const {
    std::vector<std::string> result;
    for (const auto& entry : this->codecs) {
        result.push_back(entry.first);
    }
    return result;
}
