#ifndef INTERMEDIATE_NODE_HPP
#define INTERMEDIATE_NODE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "utils.hpp"

// Generic editable tree used between the binary container and the text document.
// Attributes keep their insertion order; binary payload is kept apart from text attributes.
class IntermediateNode {
public:
    using Attribute = std::pair<std::string, std::string>;

    std::string tag;
    std::vector<Attribute> attributes;
    std::vector<IntermediateNode> children;
    std::optional<Bytes> payload;

    IntermediateNode() = default;
    explicit IntermediateNode(std::string tag) : tag(std::move(tag)) {}

    // Replaces an existing attribute in place, or appends a new one.
    IntermediateNode& set(const std::string& key, const std::string& value);
    IntermediateNode& set(const std::string& key, const char* value);
    IntermediateNode& set_int(const std::string& key, long long value);
    IntermediateNode& set_hex(const std::string& key, uint32_t value);

    bool has(const std::string& key) const;
    const std::string* find(const std::string& key) const;

    // Lookups for encoding. Missing or malformed attributes throw EncodeError.
    const std::string& get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    long long get_int(const std::string& key) const;
    long long get_int_or(const std::string& key, long long fallback) const;
    uint64_t get_uint(const std::string& key, uint64_t max) const;

    IntermediateNode& add_child(IntermediateNode child);

    // First child with the given tag; throws EncodeError if there is none.
    const IntermediateNode& child(const std::string& tag) const;
    const IntermediateNode* find_child(const std::string& tag) const;
    std::vector<const IntermediateNode*> children_with(const std::string& tag) const;

    const Bytes& require_payload() const;

    bool operator==(const IntermediateNode& other) const;
    bool operator!=(const IntermediateNode& other) const { return !(*this == other); }
};

#endif // INTERMEDIATE_NODE_HPP
