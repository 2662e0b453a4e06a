#pragma once
#include <map>
#include <string>
#include <stdexcept>
#include <utility>

enum class ErrorCode {
    UnterminatedQuote,
    NotFound,
    NotADirectory,
    IsADirectory,
    UnknownCommand,
    MissingArgument,
    InvalidTree,
    InvalidImage,
    ScriptNotFound
};

extern const std::map<ErrorCode, std::string> g_errorTable;

class VfsException : public std::runtime_error {
public:
    ErrorCode code;
    std::string subject;   // offending token or path, may be empty

    explicit VfsException(ErrorCode code, std::string subject = {})
        : std::runtime_error(g_errorTable.at(code)), code(code), subject(std::move(subject)) {}
};

inline void throwIf(bool cond, ErrorCode code, const std::string& subject = {}) {
    if (cond) throw VfsException(code, subject);
}

// "shell: <command>: <subject>: <message>" and the special forms
// for unknown commands and parser errors.
std::string formatError(const VfsException& ex, const std::string& command = {});
