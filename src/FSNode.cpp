#include "FSNode.hpp"
#include "Errors.hpp"

namespace {

bool isValidName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

}

std::shared_ptr<FSNode> makeDirNode(const std::string& name) {
    return std::make_shared<FSNode>(name, false);
}

std::shared_ptr<FSNode> makeFileNode(const std::string& name, const std::string& text) {
    auto f = std::make_shared<FSNode>(name, true);
    f->content.assignText(text);
    return f;
}

void attachChild(const std::shared_ptr<FSNode>& parent, const std::shared_ptr<FSNode>& child) {
    throwIf(!parent || !child, ErrorCode::InvalidTree);
    throwIf(parent->isFile, ErrorCode::InvalidTree, parent->name);
    throwIf(!isValidName(child->name), ErrorCode::InvalidTree, child->name);
    throwIf(parent->hasChild(child->name), ErrorCode::InvalidTree, child->name);
    throwIf(!child->parent.expired(), ErrorCode::InvalidTree, child->name);
    child->parent = parent;
    parent->children.emplace(child->name, child);
}
