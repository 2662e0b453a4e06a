#pragma once

#include "Shell.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace FrontEnd {

struct Config {
    std::optional<std::string> vfsPath;      // host directory
    std::optional<std::string> imagePath;    // base64 image file
    std::optional<std::string> scriptPath;
    bool dumpVfs = false;
};

// Loads the VFS, runs the startup script, then reads commands from in.
// Returns the process exit code: 0 on exit or end of input, 1 on a fatal
// startup error, 2 on a bad source selection.
int run(const Config& cfg, SessionOptions opts, std::istream& in,
        std::ostream& out, std::ostream& err);

}
