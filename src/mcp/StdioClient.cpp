#include "mcp/StdioClient.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

StdioClient::StdioClient(const std::string& command, std::chrono::milliseconds readTimeout)
    : serverCommand(command), readTimeout(readTimeout) {}

StdioClient::~StdioClient() {
    stopProcess();
}

std::string StdioClient::quoteArgument(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool StdioClient::startProcess() {
    int inPipe[2];   // parent -> child stdin
    int outPipe[2];  // child stdout -> parent
    if (pipe(inPipe) == -1) {
        lastError = std::string("pipe() failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe(outPipe) == -1) {
        lastError = std::string("pipe() failed: ") + std::strerror(errno);
        close(inPipe[0]);
        close(inPipe[1]);
        return false;
    }

    // A dead server must show up as a write error, not kill this process.
    signal(SIGPIPE, SIG_IGN);

    childPid = fork();
    if (childPid == -1) {
        lastError = std::string("fork() failed: ") + std::strerror(errno);
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        return false;
    }

    if (childPid == 0) { // Child
        // Own process group: a terminal Ctrl-C reaches only the CLI, which
        // lets the in-flight operation finish before shutting the server down.
        setpgid(0, 0);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);

        execl("/bin/sh", "sh", "-c", serverCommand.c_str(), (char*)NULL);
        _exit(127);
    }

    // Parent
    setpgid(childPid, childPid);
    close(inPipe[0]);
    close(outPipe[1]);
    toChild = inPipe[1];
    fromChild = outPipe[0];
    fcntl(toChild, F_SETFD, FD_CLOEXEC);
    fcntl(fromChild, F_SETFD, FD_CLOEXEC);
    readBuffer.clear();
    return true;
}

void StdioClient::stopProcess() {
    if (childPid == -1) return;

    // EOF on stdin asks the server to exit on its own.
    if (toChild != -1) {
        close(toChild);
        toChild = -1;
    }
    if (fromChild != -1) {
        close(fromChild);
        fromChild = -1;
    }

    int status = 0;
    for (int i = 0; i < 20; ++i) {
        if (waitpid(childPid, &status, WNOHANG) == childPid) {
            childPid = -1;
            return;
        }
        usleep(10000);
    }
    kill(childPid, SIGTERM);
    for (int i = 0; i < 50; ++i) {
        if (waitpid(childPid, &status, WNOHANG) == childPid) {
            childPid = -1;
            return;
        }
        usleep(10000);
    }
    kill(childPid, SIGKILL);
    while (waitpid(childPid, &status, 0) == -1 && errno == EINTR) {
    }
    childPid = -1;
}

bool StdioClient::writeLine(const std::string& line) {
    std::size_t written = 0;
    while (written < line.size()) {
        ssize_t n = write(toChild, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            lastError = std::string("write to server failed: ") + std::strerror(errno);
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

bool StdioClient::readLine(std::string& line, const Deadline& deadline) {
    while (true) {
        std::size_t newline = readBuffer.find('\n');
        if (newline != std::string::npos) {
            line = readBuffer.substr(0, newline);
            readBuffer.erase(0, newline + 1);
            return true;
        }

        if (deadline.expired()) {
            lastError = "no response from server within " + std::to_string(deadline.getBudget().count()) + "ms";
            return false;
        }

        pollfd pfd{fromChild, POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(deadline.remaining().count(), 100)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            lastError = std::string("poll() failed: ") + std::strerror(errno);
            return false;
        }
        if (rc == 0) continue;

        char buffer[4096];
        ssize_t n = read(fromChild, buffer, sizeof(buffer));
        if (n > 0) {
            readBuffer.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            lastError = "server closed the connection";
            return false;
        } else if (errno != EINTR && errno != EAGAIN) {
            lastError = std::string("read from server failed: ") + std::strerror(errno);
            return false;
        }
    }
}

nlohmann::json StdioClient::sendRequest(const std::string& method, const nlohmann::json& params) {
    if (childPid == -1) {
        lastError = "server is not running";
        return nlohmann::json::object();
    }

    int id = ++requestId;
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };

    std::string reqStr = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    if (!writeLine(reqStr)) return nlohmann::json::object();

    Deadline deadline(readTimeout);
    std::string responseLine;
    while (readLine(responseLine, deadline)) {
        // Skip non-JSON noise and responses to other ids
        if (responseLine.empty() || responseLine[0] != '{') continue;
        nlohmann::json response = nlohmann::json::parse(responseLine, nullptr, false);
        if (response.is_discarded() || !response.is_object()) continue;
        if (response.value("id", nlohmann::json()) != nlohmann::json(id)) continue;
        lastError.clear();
        return response;
    }
    return nlohmann::json::object();
}

bool StdioClient::initialize() {
    if (childPid == -1 && !startProcess()) {
        Logger::getInstance().error("transport: " + lastError);
        return false;
    }

    nlohmann::json params = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "gitflash"}, {"version", "1.0.0"}}}
    };
    auto res = sendRequest("initialize", params);
    if (!res.contains("result")) {
        if (lastError.empty()) lastError = "initialize was rejected by the server";
        Logger::getInstance().error("transport: " + lastError);
        return false;
    }

    nlohmann::json notification = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"},
        {"params", nlohmann::json::object()}
    };
    return writeLine(notification.dump() + "\n");
}

std::vector<nlohmann::json> StdioClient::listTools() {
    std::vector<nlohmann::json> schemas;
    auto res = sendRequest("tools/list", nlohmann::json::object());
    if (!res.contains("result") || !res["result"].contains("tools") || !res["result"]["tools"].is_array()) {
        Logger::getInstance().warn("transport: tools/list failed" + (lastError.empty() ? "" : ": " + lastError));
        return schemas;
    }

    for (const auto& tool : res["result"]["tools"]) {
        if (!tool.is_object() || !tool.contains("name")) continue;
        nlohmann::json function;
        if (!tool["name"].is_string()) continue;
        function["name"] = tool["name"];
        function["description"] = tool.contains("description") && tool["description"].is_string()
            ? tool["description"]
            : nlohmann::json("");
        function["parameters"] = tool.contains("inputSchema") && tool["inputSchema"].is_object()
            ? tool["inputSchema"]
            : nlohmann::json::object();
        schemas.push_back({{"type", "function"}, {"function", function}});
    }
    return schemas;
}

OperationResult StdioClient::call(const OperationRequest& request) {
    auto res = sendRequest("tools/call", request.toJson());
    if (res.contains("result")) {
        return OperationResult::fromJson(res["result"]);
    }
    if (res.contains("error") && res["error"].is_object()) {
        const auto& err = res["error"];
        std::string message = err.contains("message") && err["message"].is_string()
            ? err["message"].get<std::string>()
            : std::string("unknown error");
        if (err.contains("code") && err["code"].is_number_integer() && err["code"].get<int>() == -32602) {
            return OperationResult::failure(ErrorKind::InvalidRequest, message);
        }
        return OperationResult::failure(ErrorKind::Unknown, "transport: " + message);
    }
    return OperationResult::failure(ErrorKind::Unknown,
        "transport: " + (lastError.empty() ? std::string("malformed response from server") : lastError));
}
