#pragma once
#include "FSNode.hpp"
#include <memory>
#include <string>

// Producers of a VFS tree. All of them throw InvalidImage when the source
// cannot be read and InvalidTree when it describes an impossible tree.
namespace VfsImage {

// Base64 text wrapping the JSON produced by JsonIO::treeToJson.
std::shared_ptr<FSNode> decodeImage(const std::string& base64Text);

std::shared_ptr<FSNode> loadImageFile(const std::string& path);

// Copies a host directory into memory. Symlinks and special files are skipped.
std::shared_ptr<FSNode> loadDirectory(const std::string& path);

}
