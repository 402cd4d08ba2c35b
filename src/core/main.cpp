#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "agent/CommitFlow.h"
#include "agent/DispatchLoop.h"
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "mcp/InProcessClient.h"
#include "mcp/StdioClient.h"
#include "tools/OperationServer.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {

std::atomic<bool> g_cancelRequested{false};

void handleInterrupt(int) {
    g_cancelRequested.store(true);
    // A second Ctrl-C kills the process outright.
    std::signal(SIGINT, SIG_DFL);
}

struct CliOptions {
    bool dryRun = false;
    bool noPush = false;
    bool debug = false;
    bool help = false;
    bool hasMessage = false;
    std::string message;
    std::string configPath;
    std::string dir;
    std::string transport;
    int maxTurns = 0;
    int timeoutSeconds = 0;
    std::string instruction;
};

void printUsage() {
    std::cout << BOLD << "Usage:" << RESET << " gitflash [options] [instruction]\n\n"
              << "  With an instruction, the model plans and runs file and git operations\n"
              << "  in the project directory. With -m, stages, commits and pushes with that\n"
              << "  message. With neither, generates a commit message for the staged diff.\n\n"
              << BOLD << "Options:" << RESET << "\n"
              << "  --dry-run              Announce operations without executing them\n"
              << "  -m, --message <msg>    Commit with this message\n"
              << "  --no-push              Commit without pushing\n"
              << "  --config <path>        Config file (default: ./gitflash.json, ~/.gitflash/config.json)\n"
              << "  --dir <path>           Project directory (default: current directory)\n"
              << "  --transport <name>     builtin | stdio\n"
              << "  --max-turns <n>        Maximum number of operations per session\n"
              << "  --timeout <seconds>    Per-operation timeout\n"
              << "  --debug                Print debug messages\n"
              << "  -h, --help             Show this help\n";
}

int parsePositive(const std::string& option, const std::string& value) {
    int parsed = 0;
    try {
        std::size_t used = 0;
        parsed = std::stoi(value, &used);
        if (used != value.size()) parsed = 0;
    } catch (const std::exception&) {
        parsed = 0;
    }
    if (parsed <= 0) {
        throw std::runtime_error(option + " expects a positive integer, got '" + value + "'");
    }
    return parsed;
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    auto needValue = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) throw std::runtime_error(option + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dry-run") {
            opts.dryRun = true;
        } else if (arg == "--no-push") {
            opts.noPush = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-m" || arg == "--message") {
            opts.message = needValue(i, arg);
            opts.hasMessage = true;
        } else if (arg == "--config") {
            opts.configPath = needValue(i, arg);
        } else if (arg == "--dir") {
            opts.dir = needValue(i, arg);
        } else if (arg == "--transport") {
            opts.transport = needValue(i, arg);
        } else if (arg == "--max-turns") {
            opts.maxTurns = parsePositive(arg, needValue(i, arg));
        } else if (arg == "--timeout") {
            opts.timeoutSeconds = parsePositive(arg, needValue(i, arg));
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            // Unquoted multi-word instructions arrive as several arguments.
            if (!opts.instruction.empty()) opts.instruction += " ";
            opts.instruction += arg;
        }
    }

    if (opts.hasMessage && !opts.instruction.empty()) {
        throw std::runtime_error("Give either an instruction or -m <message>, not both");
    }
    return opts;
}

// The default server command is looked up next to this executable first.
std::string resolveServerCommand(const std::string& configured) {
    if (configured != "gitflash-server") return configured;
    std::error_code ec;
    fs::path exeDir = fs::canonical("/proc/self/exe", ec).parent_path();
    if (!ec && fs::exists(exeDir / "gitflash-server", ec)) {
        return StdioClient::quoteArgument((exeDir / "gitflash-server").u8string());
    }
    return configured;
}

std::unique_ptr<IOperationClient> makeClient(const Config& cfg, const fs::path& root, std::chrono::seconds timeout) {
    if (cfg.agent.transport == "stdio") {
        std::string command = "exec " + resolveServerCommand(cfg.agent.serverCommand) + " " +
                              StdioClient::quoteArgument(root.u8string()) +
                              " --timeout " + std::to_string(timeout.count()) +
                              " --vcs " + StdioClient::quoteArgument(cfg.agent.vcsProgram);
        auto client = std::make_unique<StdioClient>(command, timeout + std::chrono::seconds(5));
        if (!client->initialize()) {
            throw std::runtime_error("Could not start operation server: " + client->getLastError());
        }
        return client;
    }

    auto client = std::make_unique<InProcessClient>(root.u8string(), timeout);
    client->getServer().setVcsProgram(cfg.agent.vcsProgram);
    return client;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::getInstance();

    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }
    if (opts.help) {
        printUsage();
        return 0;
    }

    // Log outside the project directory so sessions never touch its tree.
    fs::path dataDir = Config::dataDir();
    std::error_code ec;
    if (!dataDir.empty()) {
        fs::create_directories(dataDir, ec);
        if (!ec) logger.setLogFile((dataDir / "gitflash.log").u8string());
    }
    logger.setDebugEnabled(opts.debug);

    Config cfg;
    try {
        std::string configPath = Config::findConfigFile(opts.configPath);
        if (!configPath.empty()) {
            cfg = Config::load(configPath);
            logger.debug("Loaded configuration from: " + configPath);
        }
        if (!opts.transport.empty()) cfg.agent.transport = opts.transport;
        if (opts.maxTurns > 0) cfg.agent.maxTurns = opts.maxTurns;
        if (opts.timeoutSeconds > 0) cfg.agent.toolTimeoutSeconds = opts.timeoutSeconds;
        if (opts.debug) cfg.agent.enableDebug = true;
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        return 1;
    }
    logger.setDebugEnabled(cfg.agent.enableDebug);

    fs::path root;
    try {
        root = fs::canonical(opts.dir.empty() ? fs::current_path() : fs::u8path(opts.dir));
    } catch (const fs::filesystem_error& e) {
        std::cerr << RED << "✖ Invalid project directory: " << e.what() << RESET << std::endl;
        return 1;
    }

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGPIPE, SIG_IGN);

    auto timeout = std::chrono::seconds(cfg.agent.toolTimeoutSeconds);
    bool needsModel = !opts.hasMessage;
    if (needsModel && !cfg.resolveApiKey(dataDir.empty() ? fs::path() : dataDir / ".env")) {
        std::cerr << RED << "✖ No API key found." << RESET << " Set " << BOLD << "llm.api_key" << RESET
                  << " in the config file, the " << BOLD << "GITFLASH_API_KEY" << RESET
                  << " environment variable, or add GITFLASH_API_KEY=\"...\" to "
                  << (dataDir / ".env").u8string() << std::endl;
        return 1;
    }

    try {
        auto llmClient = std::make_shared<LLMClient>(cfg.llm.apiKey, cfg.llm.baseUrl, cfg.llm.model);

        if (!opts.instruction.empty()) {
            auto client = makeClient(cfg, root, timeout);

            DispatchLoop::Options loopOptions;
            loopOptions.dryRun = opts.dryRun;
            loopOptions.maxTurns = cfg.agent.maxTurns;
            loopOptions.systemRole = cfg.llm.systemRole;
            loopOptions.cancelFlag = &g_cancelRequested;

            std::cout << GRAY << std::string(60, '-') << RESET << std::endl;
            std::cout << BOLD << CYAN << "GitFlash" << RESET << GRAY << "  " << root.u8string() << RESET << std::endl;
            std::cout << GRAY << std::string(60, '-') << RESET << std::endl;

            DispatchLoop loop(llmClient, *client, root, loopOptions);
            SessionOutcome outcome = loop.run(opts.instruction);

            if (outcome.cancelled) {
                std::cerr << RED << "✖ Interrupted" << RESET << std::endl;
                return 130;
            }
            if (!outcome.ok) {
                std::cerr << RED << "✖ Operation failed [" << toString(outcome.error) << "]: "
                          << outcome.message << RESET << std::endl;
                return 1;
            }
            if (!outcome.finalText.empty()) {
                std::cout << "\n" << CYAN << "Final Response:" << RESET << "\n" << outcome.finalText << std::endl;
            }
            return 0;
        }

        OperationServer server(root.u8string(), timeout);
        server.setVcsProgram(cfg.agent.vcsProgram);
        CommitFlow flow(server, opts.dryRun, !opts.noPush);

        CommitFlow::Outcome outcome = opts.hasMessage ? flow.manualCommit(opts.message) : flow.autoCommit(*llmClient);
        if (g_cancelRequested.load()) {
            std::cerr << RED << "✖ Interrupted" << RESET << std::endl;
            return 130;
        }
        if (!outcome.ok) {
            std::cerr << RED << "✖ " << outcome.summary << RESET << std::endl;
            if (!outcome.detail.empty()) std::cerr << outcome.detail << std::endl;
            return 1;
        }
        std::cout << GREEN << "✔ " << outcome.summary << RESET << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        return 1;
    }
}
