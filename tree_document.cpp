#include "tree_document.hpp"
#include <fstream>
#include <stdexcept>

json tree_to_json(const IntermediateNode& node) {
    json j;
    j["tag"] = node.tag;
    if (!node.attributes.empty()) {
        json attrs = json::object();
        for (const auto& attr : node.attributes) {
            attrs[attr.first] = attr.second;
        }
        j["attributes"] = attrs;
    }
    if (!node.children.empty()) {
        json children = json::array();
        for (const auto& child : node.children) {
            children.push_back(tree_to_json(child));
        }
        j["children"] = children;
    }
    if (node.payload.has_value()) {
        j["payload"] = bytes_to_hex(*node.payload);
    }
    return j;
}

IntermediateNode tree_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Tree node must be a JSON object");
    }
    if (!doc.contains("tag") || !doc["tag"].is_string()) {
        throw std::invalid_argument("Tree node without a string 'tag'");
    }
    IntermediateNode node(doc["tag"].get<std::string>());

    if (doc.contains("attributes")) {
        const auto& attrs = doc["attributes"];
        if (!attrs.is_object()) {
            throw std::invalid_argument("'attributes' of node '" + node.tag + "' must be an object");
        }
        for (const auto& [key, value] : attrs.items()) {
            if (value.is_string()) {
                node.attributes.emplace_back(key, value.get<std::string>());
            } else if (value.is_number_integer() || value.is_boolean()) {
                // Hand-edited documents may carry bare numbers
                node.attributes.emplace_back(key, value.dump());
            } else {
                throw std::invalid_argument("Attribute '" + key + "' of node '" + node.tag + "' must be a string");
            }
        }
    }

    if (doc.contains("children")) {
        const auto& children = doc["children"];
        if (!children.is_array()) {
            throw std::invalid_argument("'children' of node '" + node.tag + "' must be an array");
        }
        for (const auto& child : children) {
            node.children.push_back(tree_from_json(child));
        }
    }

    if (doc.contains("payload")) {
        if (!doc["payload"].is_string()) {
            throw std::invalid_argument("'payload' of node '" + node.tag + "' must be a hex string");
        }
        node.payload = unhexlify(doc["payload"].get<std::string>());
    }
    return node;
}

void save_tree_document(const std::filesystem::path& path, const IntermediateNode& root) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    out << tree_to_json(root).dump(2) << std::endl;
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

IntermediateNode load_tree_document(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    json doc = json::parse(in);
    return tree_from_json(doc);
}
