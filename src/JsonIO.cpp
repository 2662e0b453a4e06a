#include "JsonIO.hpp"
#include "Errors.hpp"
#include <json/json.h>
#include <sstream>

namespace {

void nodeToJson(const std::shared_ptr<FSNode>& n, Json::Value& jn) {
    jn["name"] = n->name;
    jn["type"] = n->isFile ? "file" : "folder";
    if (n->isFile) {
        jn["content"] = n->content.asText();
        return;
    }
    jn["children"] = Json::Value(Json::arrayValue);
    for (auto& [_, child] : n->children) {
        Json::Value jc;
        nodeToJson(child, jc);
        jn["children"].append(jc);
    }
}

[[noreturn]] void invalid(const std::string& what) {
    throw VfsException(ErrorCode::InvalidImage, "json: " + what);
}

std::shared_ptr<FSNode> nodeFromJson(const Json::Value& jn, bool isRoot) {
    if (!jn.isObject()) invalid("node is not an object");

    const auto& jtype = jn["type"];
    if (!jtype.isString()) invalid("node without type");
    auto type = jtype.asString();
    bool isFile = false;
    if (type == "file") isFile = true;
    else if (type == "folder" || type == "dir" || type == "directory") isFile = false;
    else invalid("unknown node type '" + type + "'");

    std::string name = "/";
    if (!isRoot) {
        const auto& jname = jn["name"];
        if (!jname.isString()) invalid("node without name");
        name = jname.asString();
    }

    const auto& jcontent = jn["content"];
    const auto& jchildren = jn["children"];
    if (!jcontent.isNull() && !jcontent.isString()) invalid("content of '" + name + "' is not a string");
    if (!jchildren.isNull() && !jchildren.isArray()) invalid("children of '" + name + "' is not an array");
    throwIf(isRoot && isFile, ErrorCode::InvalidTree, name);
    throwIf(isFile && !jchildren.empty(), ErrorCode::InvalidTree, name);
    throwIf(!isFile && !jcontent.isNull(), ErrorCode::InvalidTree, name);

    auto node = std::make_shared<FSNode>(name, isFile);
    if (isFile) {
        node->content.assignText(jcontent.asString());
        return node;
    }
    for (const auto& jc : jchildren)
        attachChild(node, nodeFromJson(jc, false));
    return node;
}

}

namespace JsonIO {

std::string treeToJson(const std::shared_ptr<FSNode>& root) {
    Json::Value jroot;
    nodeToJson(root, jroot);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, jroot) + "\n";
}

std::shared_ptr<FSNode> treeFromJson(const std::string& json) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    Json::Value root;
    std::istringstream in(json);
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        while (!errs.empty() && errs.back() == '\n') errs.pop_back();
        invalid(errs);
    }
    return nodeFromJson(root, true);
}

}
