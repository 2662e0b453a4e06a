#include <argparse/argparse.hpp>

#include "FrontEnd.hpp"

#include <unistd.h>
#include <climits>
#include <iostream>
#include <string>

namespace {

std::string currentUser() {
    if (const char* name = ::getlogin(); name && *name) return name;
    return "user";
}

std::string currentHost() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
    return "localhost";
}

}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("shell_emu");
    program.add_description("Shell emulator over a read-only virtual filesystem.");
    program.add_argument("--vfs-path")
        .help("host directory loaded as the VFS");
    program.add_argument("--vfs-data-path")
        .help("base64-encoded VFS image file");
    program.add_argument("--startup-script")
        .help("file with commands to run before the interactive loop");
    program.add_argument("--dump-vfs")
        .help("print the loaded VFS as JSON and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << "\n" << program;
        return 2;
    }

    FrontEnd::Config cfg;
    cfg.vfsPath    = program.present("--vfs-path");
    cfg.imagePath  = program.present("--vfs-data-path");
    cfg.scriptPath = program.present("--startup-script");
    cfg.dumpVfs    = program.get<bool>("--dump-vfs");

    SessionOptions opts;
    opts.user = currentUser();
    opts.host = currentHost();

    int rc = FrontEnd::run(cfg, opts, std::cin, std::cout, std::cerr);
    if (rc == 2) std::cerr << program;
    return rc;
}
