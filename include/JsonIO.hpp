#pragma once
#include "FSNode.hpp"
#include <string>
#include <memory>

namespace JsonIO {
std::string treeToJson(const std::shared_ptr<FSNode>& root);

// Builds a detached tree from the JSON form written by treeToJson.
// Throws InvalidImage on malformed JSON and InvalidTree on bad shape.
std::shared_ptr<FSNode> treeFromJson(const std::string& json);
}
