#include "CommandDispatcher.hpp"
#include "ShellCommands.hpp"

namespace {

LineOutcome errorOutcome(const VfsException& ex, const std::string& command) {
    LineOutcome out;
    out.kind = LineOutcome::Kind::Error;
    out.text = formatError(ex, command);
    out.error = ex.code;
    out.subject = ex.subject;
    return out;
}

}

namespace CommandDispatcher {

LineOutcome dispatch(const Vfs& vfs, Session& session, const Command& cmd) {
    LineOutcome out;
    try {
        if (cmd.name == "ls") {
            out.text = ShellCommands::ls(vfs, session, cmd.args);
        }
        else if (cmd.name == "cd") {
            out.text = ShellCommands::cd(vfs, session, cmd.args);
        }
        else if (cmd.name == "cat") {
            out.text = ShellCommands::cat(vfs, session, cmd.args);
        }
        else if (cmd.name == "exit") {
            out.text = ShellCommands::exit(vfs, session, cmd.args);
            out.kind = LineOutcome::Kind::Exit;
            return out;
        }
        else {
            throw VfsException(ErrorCode::UnknownCommand, cmd.name);
        }
    } catch (const VfsException& ex) {
        return errorOutcome(ex, cmd.name);
    }
    out.kind = (cmd.name == "cd") ? LineOutcome::Kind::Empty : LineOutcome::Kind::Output;
    return out;
}

LineOutcome executeLine(const Vfs& vfs, Session& session, const std::string& line) {
    std::optional<Command> cmd;
    try {
        cmd = CommandParser::parse(line);
    } catch (const VfsException& ex) {
        return errorOutcome(ex, {});
    }
    if (!cmd) return {};
    return dispatch(vfs, session, *cmd);
}

}
