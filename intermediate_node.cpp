#include "intermediate_node.hpp"
#include "errors.hpp"

IntermediateNode& IntermediateNode::set(const std::string& key, const std::string& value) {
    for (auto& attr : this->attributes) {
        if (attr.first == key) {
            attr.second = value;
            return *this;
        }
    }
    this->attributes.emplace_back(key, value);
    return *this;
}

IntermediateNode& IntermediateNode::set(const std::string& key, const char* value) {
    return set(key, std::string(value));
}

IntermediateNode& IntermediateNode::set_int(const std::string& key, long long value) {
    return set(key, std::to_string(value));
}

IntermediateNode& IntermediateNode::set_hex(const std::string& key, uint32_t value) {
    return set(key, format_hex32(value));
}

bool IntermediateNode::has(const std::string& key) const {
    return find(key) != nullptr;
}

const std::string* IntermediateNode::find(const std::string& key) const {
    for (const auto& attr : this->attributes) {
        if (attr.first == key) {
            return &attr.second;
        }
    }
    return nullptr;
}

const std::string& IntermediateNode::get(const std::string& key) const {
    const std::string* value = find(key);
    if (value == nullptr) {
        throw EncodeError("Node '" + this->tag + "' has no attribute '" + key + "'");
    }
    return *value;
}

std::string IntermediateNode::get_or(const std::string& key, const std::string& fallback) const {
    const std::string* value = find(key);
    return value ? *value : fallback;
}

long long IntermediateNode::get_int(const std::string& key) const {
    const std::string& text = get(key);
    try {
        return parse_integer(text);
    } catch (const std::logic_error&) {
        throw EncodeError("Attribute '" + key + "' of node '" + this->tag + "' is not an integer: '" + text + "'");
    }
}

long long IntermediateNode::get_int_or(const std::string& key, long long fallback) const {
    return has(key) ? get_int(key) : fallback;
}

uint64_t IntermediateNode::get_uint(const std::string& key, uint64_t max) const {
    long long value = get_int(key);
    if (value < 0 || static_cast<unsigned long long>(value) > max) {
        throw EncodeError("Attribute '" + key + "' of node '" + this->tag + "' is out of range: " +
                          std::to_string(value));
    }
    return static_cast<uint64_t>(value);
}

IntermediateNode& IntermediateNode::add_child(IntermediateNode child) {
    this->children.push_back(std::move(child));
    return this->children.back();
}

const IntermediateNode& IntermediateNode::child(const std::string& tag) const {
    const IntermediateNode* found = find_child(tag);
    if (found == nullptr) {
        throw EncodeError("Node '" + this->tag + "' has no child '" + tag + "'");
    }
    return *found;
}

const IntermediateNode* IntermediateNode::find_child(const std::string& tag) const {
    for (const auto& c : this->children) {
        if (c.tag == tag) {
            return &c;
        }
    }
    return nullptr;
}

std::vector<const IntermediateNode*> IntermediateNode::children_with(const std::string& tag) const {
    std::vector<const IntermediateNode*> found;
    for (const auto& c : this->children) {
        if (c.tag == tag) {
            found.push_back(&c);
        }
    }
    return found;
}

const Bytes& IntermediateNode::require_payload() const {
    if (!this->payload.has_value()) {
        throw EncodeError("Node '" + this->tag + "' carries no binary payload");
    }
    return *this->payload;
}

bool IntermediateNode::operator==(const IntermediateNode& other) const {
    return this->tag == other.tag && this->attributes == other.attributes &&
           this->children == other.children && this->payload == other.payload;
}
