#include "Vfs.hpp"
#include "Path.hpp"
#include <vector>
#include <set>

namespace {

using NodePtr = std::shared_ptr<FSNode>;

void validateRec(const NodePtr& n, std::set<const FSNode*>& seen) {
    throwIf(!seen.insert(n.get()).second, ErrorCode::InvalidTree, n->name);
    if (n->isFile) {
        throwIf(!n->children.empty(), ErrorCode::InvalidTree, n->name);
        return;
    }
    for (auto& [name, child] : n->children) {
        throwIf(!child, ErrorCode::InvalidTree, name);
        throwIf(child->name != name, ErrorCode::InvalidTree, name);
        throwIf(child->parent.lock() != n, ErrorCode::InvalidTree, name);
        validateRec(child, seen);
    }
}

}

Vfs::Vfs(NodePtr root) : root_(std::move(root)) {
    validateTree(root_);
}

void Vfs::validateTree(const NodePtr& root) {
    throwIf(!root, ErrorCode::InvalidTree);
    throwIf(root->isFile, ErrorCode::InvalidTree, root->name);
    throwIf(!root->parent.expired(), ErrorCode::InvalidTree, root->name);
    std::set<const FSNode*> seen;
    validateRec(root, seen);
}

Vfs::NodePtr Vfs::resolve(const NodePtr& cwd, const std::string& path) const {
    auto p = parsePath(path);
    NodePtr cur = (p.absolute || !cwd) ? root_ : cwd;

    for (const auto& name : p.segments) {
        throwIf(cur->isFile, ErrorCode::NotADirectory, path);
        if (name==".") continue;
        if (name=="..") {
            if (auto up = cur->parent.lock()) cur = up;
            continue;
        }
        auto next = cur->getChild(name);
        throwIf(!next, ErrorCode::NotFound, path);
        cur = next;
    }
    throwIf(p.trailingSlash && cur->isFile, ErrorCode::NotADirectory, path);
    return cur;
}

std::vector<Vfs::Entry> Vfs::list(const NodePtr& node) const {
    std::vector<Entry> out;
    if (!node) return out;
    if (node->isFile) {
        out.push_back({node->name, true});
        return out;
    }
    out.reserve(node->children.size());
    for (auto& [name, child] : node->children)
        out.push_back({name, child->isFile});
    return out;
}

std::string Vfs::fullPathOf(const NodePtr& n) {
    if (!n) return "/";
    std::vector<std::string> parts;
    auto cur = n;
    while (auto up = cur->parent.lock()) { parts.push_back(cur->name); cur = up; }
    std::string out;
    for (auto it = parts.rbegin(); it!=parts.rend(); ++it) {
        out += "/";
        out += *it;
    }
    if (out.empty()) out = "/";
    return out;
}
