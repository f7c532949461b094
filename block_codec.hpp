#ifndef BLOCK_CODEC_HPP
#define BLOCK_CODEC_HPP

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "format_context.hpp"
#include "intermediate_node.hpp"
#include "utils.hpp"

// Turns the content bytes of one section into a tree node and back.
// encode(decode(b, ctx), ctx) must reproduce b exactly.
class BlockCodec {
public:
    virtual ~BlockCodec() = default;

    // Throws an RsrcError when the bytes do not follow the expected layout.
    virtual IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const = 0;

    // Throws EncodeError or VersionMismatchError when the node cannot be stored.
    virtual Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const = 0;
};

// Keeps the section bytes untouched in an "Opaque" node.
class PassthroughCodec : public BlockCodec {
public:
    static constexpr const char* NODE_TAG = "Opaque";

    IntermediateNode decode(const Bytes& data, const FormatContext& ctx) const override;
    Bytes encode(const IntermediateNode& node, const FormatContext& ctx) const override;
};

// Exact 4-character tag -> codec. Built once on first use, read-only afterwards.
class BlockCodecRegistry {
public:
    static const BlockCodecRegistry& instance();

    // nullptr for tags without a typed codec.
    const BlockCodec* find(const std::string& ident) const;
    const BlockCodec& passthrough() const { return this->fallback; }
    std::vector<std::string> tags() const;

private:
    BlockCodecRegistry();

    template<typename Codec, typename... Args>
    void add(std::initializer_list<const char*> idents, Args&&... args);

    std::map<std::string, std::shared_ptr<const BlockCodec>> codecs;
    PassthroughCodec fallback;
};

#endif // BLOCK_CODEC_HPP
