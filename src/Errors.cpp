#include "Errors.hpp"

const std::map<ErrorCode, std::string> g_errorTable = {
    {ErrorCode::UnterminatedQuote, "No closing quotation"},
    {ErrorCode::NotFound,          "No such file or directory"},
    {ErrorCode::NotADirectory,     "Not a directory"},
    {ErrorCode::IsADirectory,      "Is a directory"},
    {ErrorCode::UnknownCommand,    "command not found"},
    {ErrorCode::MissingArgument,   "missing operand"},
    {ErrorCode::InvalidTree,       "Invalid VFS tree"},
    {ErrorCode::InvalidImage,      "Cannot load VFS image"},
    {ErrorCode::ScriptNotFound,    "Startup script not found"},
};

std::string formatError(const VfsException& ex, const std::string& command) {
    switch (ex.code) {
        case ErrorCode::UnterminatedQuote:
            return "shell: parser error: " + std::string(ex.what());
        case ErrorCode::UnknownCommand:
            return "shell: " + ex.subject + ": " + ex.what();
        case ErrorCode::MissingArgument:
            return "shell: " + command + ": " + ex.what();
        default:
            break;
    }
    std::string out = "shell: ";
    if (!command.empty()) out += command + ": ";
    if (!ex.subject.empty()) out += ex.subject + ": ";
    return out + ex.what();
}
