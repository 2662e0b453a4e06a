#include "VfsImage.hpp"
#include "Base64.hpp"
#include "JsonIO.hpp"
#include "Errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::uint8_t> readBytes(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    throwIf(!f, ErrorCode::InvalidImage, p.string());
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(f)),
                                   std::istreambuf_iterator<char>());
    throwIf(f.bad(), ErrorCode::InvalidImage, p.string());
    return data;
}

void copyDirRec(const fs::path& hostDir, const std::shared_ptr<FSNode>& into) {
    std::error_code ec;
    fs::directory_iterator it(hostDir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code stEc;
        auto st = entry.symlink_status(stEc);
        if (stEc) {
            std::cerr << "shell: warning: cannot stat " << entry.path().string() << "\n";
            continue;
        }
        auto name = entry.path().filename().string();
        if (fs::is_directory(st)) {
            auto dir = makeDirNode(name);
            attachChild(into, dir);
            copyDirRec(entry.path(), dir);
        } else if (fs::is_regular_file(st)) {
            auto file = std::make_shared<FSNode>(name, true);
            file->content = FileContent(readBytes(entry.path()));
            attachChild(into, file);
        } else {
            std::cerr << "shell: warning: skipping " << entry.path().string()
                      << " (not a regular file or directory)\n";
        }
    }
    throwIf(static_cast<bool>(ec), ErrorCode::InvalidImage, hostDir.string());
}

}

namespace VfsImage {

std::shared_ptr<FSNode> decodeImage(const std::string& base64Text) {
    auto raw = base64Decode(base64Text);
    return JsonIO::treeFromJson(std::string(raw.begin(), raw.end()));
}

std::shared_ptr<FSNode> loadImageFile(const std::string& path) {
    auto data = readBytes(path);
    return decodeImage(std::string(data.begin(), data.end()));
}

std::shared_ptr<FSNode> loadDirectory(const std::string& path) {
    std::error_code ec;
    throwIf(!fs::is_directory(path, ec), ErrorCode::InvalidImage, path);
    auto root = makeDirNode("/");
    copyDirRec(path, root);
    return root;
}

}
