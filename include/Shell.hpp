#pragma once

#include "Session.hpp"
#include "Vfs.hpp"

#include <iosfwd>
#include <string>

struct SessionOptions {
    bool interactive = false;    // prompt before every read
    bool echoCommands = false;   // startup script: show each line as if typed
    std::string user = "user";
    std::string host = "localhost";
};

namespace Shell {

// user@host:/cwd$
std::string makePrompt(const Session& session, const SessionOptions& opts);

// Reads lines until exit or end of input. Payloads go to out, errors to err.
SessionEnd runSession(const Vfs& vfs, Session& session, std::istream& in,
                      std::ostream& out, std::ostream& err, const SessionOptions& opts);

}
