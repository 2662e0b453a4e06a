#pragma once

#include <memory>
#include <string>
#include <map>
#include "FileContent.hpp"

struct FSNode {
    std::string name;
    bool isFile;
    std::weak_ptr<FSNode> parent;   // non-owning, for path display and ".."
    std::map<std::string, std::shared_ptr<FSNode>> children;

    FileContent content;

    FSNode(std::string name, bool isFile) : name(std::move(name)), isFile(isFile) {}

    std::shared_ptr<FSNode> getChild(const std::string& childName) const {
        auto it = children.find(childName);
        if (it == children.end()) return nullptr;
        return it->second;
    }

    bool hasChild(const std::string& childName) const {
        return children.find(childName) != children.end();
    }
};

std::shared_ptr<FSNode> makeDirNode(const std::string& name);
std::shared_ptr<FSNode> makeFileNode(const std::string& name, const std::string& text = {});

// Links child under parent. Throws InvalidTree when parent is a file,
// the name is already taken, or child already has a parent.
void attachChild(const std::shared_ptr<FSNode>& parent, const std::shared_ptr<FSNode>& child);
