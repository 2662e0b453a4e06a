#pragma once

#include "FSNode.hpp"
#include "Errors.hpp"
#include <memory>
#include <string>
#include <vector>

// Read-only view over a VFS tree. The tree is validated once on
// construction and never mutated afterwards, so one Vfs may back any
// number of sessions.
class Vfs {
public:
    using NodePtr = std::shared_ptr<FSNode>;

    struct Entry {
        std::string name;
        bool isFile;
    };

    explicit Vfs(NodePtr root);

    [[nodiscard("use root")]] const NodePtr& root() const noexcept { return root_; }

    // Absolute paths start at the root, anything else at cwd. Throws
    // NotFound or NotADirectory; never returns null.
    [[nodiscard("check node")]] NodePtr resolve(const NodePtr& cwd, const std::string& path) const;

    // Children of a directory in name order, or the file itself.
    [[nodiscard("use listing")]] std::vector<Entry> list(const NodePtr& node) const;

    static std::string fullPathOf(const NodePtr& n);

private:
    NodePtr root_;

    static void validateTree(const NodePtr& root);
};
