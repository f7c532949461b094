#ifndef TREE_DOCUMENT_HPP
#define TREE_DOCUMENT_HPP

#include <filesystem>
#include <string>
#include "intermediate_node.hpp"
#include "utils.hpp"

// Node <-> JSON object:
//   {"tag": "...", "attributes": {...}, "children": [...], "payload": "<hex>"}
// Empty attribute maps, child lists and absent payloads are omitted.
json tree_to_json(const IntermediateNode& node);

// Throws std::invalid_argument when the document does not have the node shape.
IntermediateNode tree_from_json(const json& doc);

void save_tree_document(const std::filesystem::path& path, const IntermediateNode& root);
IntermediateNode load_tree_document(const std::filesystem::path& path);

#endif // TREE_DOCUMENT_HPP
