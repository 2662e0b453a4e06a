#pragma once

#include "CommandParser.hpp"
#include "Errors.hpp"
#include "Session.hpp"
#include "Vfs.hpp"

#include <optional>
#include <string>

// Result of one input line. Errors never leave the line that caused them.
struct LineOutcome {
    enum class Kind { Empty, Output, Error, Exit };

    Kind kind = Kind::Empty;
    std::string text;                 // payload, or the formatted error
    std::optional<ErrorCode> error;
    std::string subject;              // offending token or path

    bool ok() const noexcept { return kind != Kind::Error; }
};

namespace CommandDispatcher {

[[nodiscard("check outcome")]] LineOutcome dispatch(const Vfs& vfs, Session& session, const Command& cmd);

// Tokenize + dispatch for a raw line.
[[nodiscard("check outcome")]] LineOutcome executeLine(const Vfs& vfs, Session& session, const std::string& line);

}
