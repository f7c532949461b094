#include "block_codecs.hpp"
#include "errors.hpp"
#include "version.hpp"

namespace {

enum class FieldKind {
    U16Hex,
    U16Int,
    U32Hex,
    I32,
    Hash16
};

struct RecordField {
    const char* name;
    FieldKind kind;
};

// Fixed part of the save record, offsets 0x08 to 0x77.
const RecordField SAVE_RECORD_FIELDS[] = {
    {"Field08", FieldKind::U32Hex},
    {"Field0C", FieldKind::U32Hex},
    {"Flags10", FieldKind::U16Hex},
    {"Field12", FieldKind::U16Hex},
    {"ButtonsHidden", FieldKind::U16Hex},
    {"FrontpFlags", FieldKind::U16Hex},
    {"InstrState", FieldKind::U32Hex},
    {"ExecState", FieldKind::U32Hex},
    {"ExecPrio", FieldKind::U16Int},
    {"ViType", FieldKind::U16Int},
    {"Field24", FieldKind::I32},
    {"Field28", FieldKind::U32Hex},
    {"Field2C", FieldKind::U32Hex},
    {"Field30", FieldKind::U32Hex},
    {"ViSignature", FieldKind::Hash16},
    {"Field44", FieldKind::U32Hex},
    {"Field48", FieldKind::U32Hex},
    {"Field4C", FieldKind::U16Hex},
    {"Field4E", FieldKind::U16Hex},
    {"Field50Hash", FieldKind::Hash16},
    {"LibpassHash", FieldKind::Hash16},
    {"Field70", FieldKind::U32Hex},
    {"Field74", FieldKind::I32},
};

constexpr size_t SAVE_RECORD_FIXED_SIZE = 120;
constexpr size_t HASH_SIZE = 16;

void read_field(ByteReader& reader, const RecordField& field, IntermediateNode& node) {
    switch (field.kind) {
        case FieldKind::U16Hex: node.set_hex(field.name, reader.u16()); break;
        case FieldKind::U16Int: node.set_int(field.name, reader.u16()); break;
        case FieldKind::U32Hex: node.set_hex(field.name, reader.u32()); break;
        case FieldKind::I32: node.set_int(field.name, reader.i32()); break;
        case FieldKind::Hash16: node.set(field.name, bytes_to_hex(reader.bytes(HASH_SIZE))); break;
    }
}

void write_field(ByteWriter& writer, const RecordField& field, const IntermediateNode& node) {
    switch (field.kind) {
        case FieldKind::U16Hex:
        case FieldKind::U16Int: writer.u16(node.get_uint(field.name, 0xFFFF)); break;
        case FieldKind::U32Hex: writer.u32(node.get_uint(field.name, 0xFFFFFFFF)); break;
        case FieldKind::I32: writer.i32(node.get_int(field.name)); break;
        case FieldKind::Hash16: writer.bytes(hex_attribute(node, field.name, HASH_SIZE)); break;
    }
}

bool all_zero(const Bytes& data) {
    for (uint8_t b : data) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace

// --- LVSR / LVIN ---

IntermediateNode SaveRecordCodec::decode(const Bytes& data, const FormatContext&) const {
    ByteReader reader(data);
    IntermediateNode node("SaveRecord");
    const LvVersion version = LvVersion::decode(reader.u32());
    node.add_child(version_to_node(version));

    const uint32_t exec_flags = reader.u32();
    node.set("Protected", (exec_flags & EXEC_FLAG_PROTECTED) ? "true" : "false");
    node.set_hex("ExecFlags", exec_flags & ~EXEC_FLAG_PROTECTED);

    if (data.size() >= SAVE_RECORD_FIXED_SIZE) {
        for (const auto& field : SAVE_RECORD_FIELDS) {
            read_field(reader, field, node);
        }
        if (version.is_greater_or_eq(10, 0, VersionStage::Release) && reader.remaining() >= HASH_SIZE) {
            node.set("Field78Hash", bytes_to_hex(reader.bytes(HASH_SIZE)));
            if (version.is_greater_or_eq(14) && reader.remaining() >= 1) {
                node.set_int("InlineStg", reader.u8());
                // Field8C follows three zero pad bytes; anything else stays in the tail
                if (version.is_greater_or_eq(15) && reader.remaining() >= 7) {
                    const size_t pad_pos = reader.tell();
                    if (all_zero(reader.bytes(3))) {
                        node.set_hex("Field8C", reader.u32());
                    } else {
                        reader.seek(pad_pos);
                    }
                }
            }
        }
    }
    keep_tail(reader, node);
    return node;
}

Bytes SaveRecordCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, "SaveRecord");
    ByteWriter writer;
    writer.u32(version_from_node(node.child("Version")).encode());

    uint32_t exec_flags = static_cast<uint32_t>(node.get_uint("ExecFlags", 0xFFFFFFFF)) & ~EXEC_FLAG_PROTECTED;
    if (bool_attribute(node, "Protected")) {
        exec_flags |= EXEC_FLAG_PROTECTED;
    }
    writer.u32(exec_flags);

    // Fixed fields are all-or-nothing; the optional ones are written as present
    if (node.has(SAVE_RECORD_FIELDS[0].name)) {
        for (const auto& field : SAVE_RECORD_FIELDS) {
            write_field(writer, field, node);
        }
        if (node.has("Field78Hash")) {
            writer.bytes(hex_attribute(node, "Field78Hash", HASH_SIZE));
        }
        if (node.has("InlineStg")) {
            writer.u8(node.get_uint("InlineStg", 0xFF));
        }
        if (node.has("Field8C")) {
            writer.zeros(3);
            writer.u32(node.get_uint("Field8C", 0xFFFFFFFF));
        }
    }
    write_tail(writer, node);
    return writer.take();
}

// --- vers ---

IntermediateNode VersionResourceCodec::decode(const Bytes& data, const FormatContext& ctx) const {
    ByteReader reader(data);
    IntermediateNode node("VersionResource");
    node.add_child(version_to_node(LvVersion::decode(reader.u32())));

    if (ctx.layout == ContainerLayout::Extended && ctx.version_at_least(8)) {
        node.set_int("Language", reader.u16());
        node.set("Text", read_text(reader, ctx));
        node.set("Info", read_text(reader, ctx));
    } else {
        node.set("Text", read_text(reader, ctx));
        size_t pos = reader.absolute();
        if (reader.u8() != 0) {
            throw FormatError("Non-zero pad byte after version text", pos);
        }
        node.set("Info", read_text(reader, ctx));
        pos = reader.absolute();
        if (reader.u8() != 0) {
            throw FormatError("Non-zero pad byte after version info", pos);
        }
    }
    keep_tail(reader, node);
    return node;
}

Bytes VersionResourceCodec::encode(const IntermediateNode& node, const FormatContext& ctx) const {
    expect_tag(node, "VersionResource");
    ByteWriter writer;
    writer.u32(version_from_node(node.child("Version")).encode());

    if (ctx.layout == ContainerLayout::Extended && ctx.version_at_least(8)) {
        writer.u16(node.has("Language") ? node.get_uint("Language", 0xFFFF) : 0);
        write_text(writer, node.get("Text"), ctx);
        write_text(writer, node.get("Info"), ctx);
    } else {
        if (node.get_int_or("Language", 0) != 0) {
            throw VersionMismatchError("Version resources before LabVIEW 8 carry no language code");
        }
        write_text(writer, node.get("Text"), ctx);
        writer.u8(0);
        write_text(writer, node.get("Info"), ctx);
        writer.u8(0);
    }
    write_tail(writer, node);
    return writer.take();
}

// --- BDPW ---

namespace {

const char* const PASSWORD_FIELDS[] = {"PasswordHash", "Hash1", "Hash2"};

} // namespace

IntermediateNode PasswordCodec::decode(const Bytes& data, const FormatContext&) const {
    ByteReader reader(data);
    IntermediateNode node("Password");
    for (const char* name : PASSWORD_FIELDS) {
        if (reader.remaining() < HASH_SIZE) {
            break;
        }
        node.set(name, bytes_to_hex(reader.bytes(HASH_SIZE)));
    }
    keep_tail(reader, node);
    return node;
}

Bytes PasswordCodec::encode(const IntermediateNode& node, const FormatContext&) const {
    expect_tag(node, "Password");
    ByteWriter writer;
    for (const char* name : PASSWORD_FIELDS) {
        if (!node.has(name)) {
            break;
        }
        writer.bytes(hex_attribute(node, name, HASH_SIZE));
    }
    write_tail(writer, node);
    return writer.take();
}
