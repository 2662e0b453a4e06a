#pragma once

#include "Vfs.hpp"

enum class SessionEnd { Exit, EndOfInput };

// Per-session state. Only cd moves cwd and only exit sets terminated.
struct Session {
    Vfs::NodePtr cwd;
    bool terminated = false;

    explicit Session(const Vfs& vfs) : cwd(vfs.root()) {}
};
