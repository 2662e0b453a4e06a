#include "FrontEnd.hpp"
#include "Errors.hpp"
#include "JsonIO.hpp"
#include "Session.hpp"
#include "Vfs.hpp"
#include "VfsImage.hpp"

#include <fstream>
#include <istream>
#include <optional>
#include <ostream>

namespace {

void printStartupParameters(const FrontEnd::Config& cfg, std::ostream& out) {
    out << "--- EMULATOR STARTUP PARAMETERS ---\n"
        << "VFS Path: " << cfg.vfsPath.value_or("None") << "\n"
        << "VFS Image: " << cfg.imagePath.value_or("None") << "\n"
        << "Startup Script: " << cfg.scriptPath.value_or("None") << "\n"
        << "-----------------------------------\n";
}

}

namespace FrontEnd {

int run(const Config& cfg, SessionOptions opts, std::istream& in,
        std::ostream& out, std::ostream& err) {
    if (cfg.vfsPath.has_value() == cfg.imagePath.has_value()) {
        err << "shell: exactly one of --vfs-path or --vfs-data-path is required\n";
        return 2;
    }

    std::optional<Vfs> vfs;
    try {
        vfs.emplace(cfg.vfsPath ? VfsImage::loadDirectory(*cfg.vfsPath)
                                : VfsImage::loadImageFile(*cfg.imagePath));
    } catch (const VfsException& ex) {
        err << formatError(ex) << "\n";
        return 1;
    }

    if (cfg.dumpVfs) {
        out << JsonIO::treeToJson(vfs->root());
        return 0;
    }

    printStartupParameters(cfg, out);

    Session session(*vfs);
    if (cfg.scriptPath) {
        std::ifstream script(*cfg.scriptPath);
        if (!script) {
            err << formatError(VfsException(ErrorCode::ScriptNotFound, *cfg.scriptPath)) << "\n";
            return 1;
        }
        out << "\n--- EXECUTION STARTUP SCRIPT: " << *cfg.scriptPath << " ---\n";
        opts.echoCommands = true;
        opts.interactive = false;
        auto end = Shell::runSession(*vfs, session, script, out, err, opts);
        out << "--- SCRIPT EXECUTION FINISHED ---\n\n";
        if (end == SessionEnd::Exit) {
            out << "Script executed 'exit'. Goodbye!\n";
            return 0;
        }
        opts.echoCommands = false;
    }

    out << "--- Starting Interactive REPL ---\n";
    opts.interactive = true;
    auto end = Shell::runSession(*vfs, session, in, out, err, opts);
    if (end == SessionEnd::EndOfInput)
        out << "Exiting shell emulator (EOF). Goodbye!\n";
    else
        out << "Exiting shell emulator. Goodbye!\n";
    return 0;
}

}
