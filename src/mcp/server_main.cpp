#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include "core/ConfigManager.h"
#include "mcp/StdioServer.h"
#include "tools/OperationServer.h"
#include "utils/Logger.h"

namespace {

void printUsage() {
    std::cerr << "Usage: gitflash-server <project-dir> [--timeout SECONDS] [--vcs PROGRAM]\n"
              << "Serves the file and git operations for <project-dir> as JSON-RPC 2.0 over stdin/stdout.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout is the RPC channel; diagnostics go to the log file only.
    auto& logger = Logger::getInstance();
    logger.setConsoleEnabled(false);
    std::filesystem::path dataDir = Config::dataDir();
    std::error_code ec;
    if (!dataDir.empty() && std::filesystem::is_directory(dataDir, ec)) {
        logger.setLogFile((dataDir / "gitflash-server.log").u8string());
    }

    std::signal(SIGPIPE, SIG_IGN);

    std::string root;
    int timeoutSeconds = OperationServer::kDefaultTimeoutMs / 1000;
    std::string vcsProgram = "git";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--timeout" && i + 1 < argc) {
            try {
                timeoutSeconds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "gitflash-server: invalid --timeout value\n";
                return 1;
            }
        } else if (arg == "--vcs" && i + 1 < argc) {
            vcsProgram = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (root.empty() && !arg.empty() && arg[0] != '-') {
            root = arg;
        } else {
            printUsage();
            return 1;
        }
    }

    if (root.empty() || timeoutSeconds <= 0) {
        printUsage();
        return 1;
    }

    try {
        OperationServer server(root, std::chrono::seconds(timeoutSeconds));
        server.setVcsProgram(vcsProgram);
        logger.info("gitflash-server serving " + server.workingRoot().u8string());

        StdioServer rpc(server);
        rpc.serve(std::cin, std::cout);
    } catch (const std::exception& e) {
        logger.error(e.what());
        std::cerr << "gitflash-server: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
