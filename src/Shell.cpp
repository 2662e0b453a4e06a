#include "Shell.hpp"
#include "CommandDispatcher.hpp"

#include <iostream>
#include <string>

namespace {

std::string trimCopy(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

void report(const LineOutcome& outcome, std::ostream& out, std::ostream& err,
            const SessionOptions& opts, std::size_t lineNo) {
    switch (outcome.kind) {
        case LineOutcome::Kind::Output:
            out << outcome.text;
            if (!outcome.text.empty() && outcome.text.back() != '\n') out << '\n';
            break;
        case LineOutcome::Kind::Error:
            err << outcome.text << "\n";
            if (opts.echoCommands && outcome.error == ErrorCode::UnterminatedQuote)
                err << "shell: ERROR in script line " << lineNo << ": Skipping command.\n";
            break;
        case LineOutcome::Kind::Empty:
        case LineOutcome::Kind::Exit:
            break;
    }
}

}

namespace Shell {

std::string makePrompt(const Session& session, const SessionOptions& opts) {
    return opts.user + "@" + opts.host + ":" + Vfs::fullPathOf(session.cwd) + "$ ";
}

SessionEnd runSession(const Vfs& vfs, Session& session, std::istream& in,
                      std::ostream& out, std::ostream& err, const SessionOptions& opts) {
    std::string line;
    std::size_t lineNo = 0;

    while (!session.terminated) {
        if (opts.interactive) {
            out << makePrompt(session, opts);
            out.flush();
        }
        if (!std::getline(in, line)) {
            if (opts.interactive) out << "\n";
            return SessionEnd::EndOfInput;
        }
        ++lineNo;

        if (opts.echoCommands) {
            auto shown = trimCopy(line);
            if (!shown.empty() && shown.front() != '#')
                out << "Executing: " << makePrompt(session, opts) << shown << "\n";
        }

        auto outcome = CommandDispatcher::executeLine(vfs, session, line);
        report(outcome, out, err, opts, lineNo);
        out.flush();
    }
    return SessionEnd::Exit;
}

}
