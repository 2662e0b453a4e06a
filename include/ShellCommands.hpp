#pragma once
#include <string>
#include <vector>

class Vfs;
struct Session;

namespace ShellCommands {

// Each command returns its output text and throws VfsException on error.
std::string ls(const Vfs& vfs, Session& session, const std::vector<std::string>& args);
std::string cd(const Vfs& vfs, Session& session, const std::vector<std::string>& args);
std::string cat(const Vfs& vfs, Session& session, const std::vector<std::string>& args);
std::string exit(const Vfs& vfs, Session& session, const std::vector<std::string>& args);

}
