#ifndef BLOCK_CODECS_HPP
#define BLOCK_CODECS_HPP

#include <cstddef>
#include <string>
#include "block_codec.hpp"
#include "byte_stream.hpp"

// Shared field helpers for the typed codecs.
std::string read_text(ByteReader& reader, const FormatContext& ctx, size_t length_width = 1);
void write_text(ByteWriter& writer, const std::string& text, const FormatContext& ctx, size_t length_width = 1);

// Pascal string followed by one zero byte when its length is even, keeping the next field 2-aligned.
std::string read_padded_text(ByteReader& reader, const FormatContext& ctx);
void write_padded_text(ByteWriter& writer, const std::string& text, const FormatContext& ctx);

// Fixed-size binary field stored as a hex attribute.
Bytes hex_attribute(const IntermediateNode& node, const std::string& key, size_t size);
bool bool_attribute(const IntermediateNode& node, const std::string& key);

// Unparsed trailing bytes travel in the content node's payload.
void keep_tail(ByteReader& reader, IntermediateNode& node);
void write_tail(ByteWriter& writer, const IntermediateNode& node);

// Expects the node produced by the matching decode.
void expect_tag(const IntermediateNode& node, const char* tag);

// Known-format binary content kept as one blob (heaps, archives).
class BlobCodec : public BlockCodec {
public:
    explicit BlobCodec(const char* node_tag) : node_tag(node_tag) {}

    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;

private:
    const char* node_tag;
};

// Bitmaps with a known byte size (icl8, icl4, ICON).
class FixedBlobCodec : public BlockCodec {
public:
    explicit FixedBlobCodec(size_t size) : size(size) {}

    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;

private:
    size_t size;
};

// One big-endian unsigned integer of 1, 2 or 4 bytes.
class IntegerCodec : public BlockCodec {
public:
    IntegerCodec(size_t width, bool hex) : width(width), hex(hex) {}

    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;

private:
    size_t width;
    bool hex;
};

// Length-prefixed text split into lines on its dominant end-of-line sequence.
class MultilineTextCodec : public BlockCodec {
public:
    explicit MultilineTextCodec(size_t length_width) : length_width(length_width) {}

    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;

private:
    size_t length_width;
};

// 'STR ': a Pascal string in library files, unknown binary elsewhere.
class ShortStringCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

// LVSR and its predecessor LVIN.
class SaveRecordCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

class VersionResourceCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

// BDPW: password digest and two derived hashes, copied through uninterpreted.
class PasswordCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

class FontTableCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

// LIvi, LIfp, LIbd, LIds: dependency links of the VI, panel, diagram and data space.
class LinkInfoCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

class LibraryNamesCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

// HIST and HBUF revision records.
class HistoryCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

class ConnectorMapCodec : public BlockCodec {
public:
    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

#endif // BLOCK_CODECS_HPP
