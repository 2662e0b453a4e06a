#include "ShellCommands.hpp"
#include "Vfs.hpp"
#include "Session.hpp"
#include "Errors.hpp"

#include <sstream>

namespace ShellCommands {

std::string ls(const Vfs& vfs, Session& session, const std::vector<std::string>& args) {
    auto node = args.empty() ? session.cwd : vfs.resolve(session.cwd, args[0]);
    if (node->isFile) return args[0] + "\n";   // echoed as typed
    std::ostringstream oss;
    for (const auto& e : vfs.list(node)) {
        oss << e.name << (e.isFile ? "" : "/") << "\n";
    }
    return oss.str();
}

std::string cd(const Vfs& vfs, Session& session, const std::vector<std::string>& args) {
    throwIf(args.empty(), ErrorCode::MissingArgument);
    auto dest = vfs.resolve(session.cwd, args[0]);
    throwIf(dest->isFile, ErrorCode::NotADirectory, args[0]);
    session.cwd = dest;
    return {};
}

std::string cat(const Vfs& vfs, Session& session, const std::vector<std::string>& args) {
    throwIf(args.empty(), ErrorCode::MissingArgument);
    auto file = vfs.resolve(session.cwd, args[0]);
    throwIf(!file->isFile, ErrorCode::IsADirectory, args[0]);
    return file->content.asText();
}

std::string exit(const Vfs&, Session& session, const std::vector<std::string>&) {
    session.terminated = true;
    return {};
}

}
