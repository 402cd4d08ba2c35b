#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sys/types.h>
#include "mcp/IOperationClient.h"
#include "utils/Deadline.h"

/**
 * @brief Talks to a gitflash-server child over newline-delimited JSON-RPC 2.0.
 *
 * The child runs through `/bin/sh -c`, reads requests on stdin and writes one
 * response line per request on stdout. One request is outstanding at a time.
 * Every read is bounded by readTimeout so a hung server cannot block the
 * session. The child is terminated and reaped by the destructor.
 */
class StdioClient : public IOperationClient {
public:
    StdioClient(const std::string& serverCommand, std::chrono::milliseconds readTimeout);
    ~StdioClient() override;

    StdioClient(const StdioClient&) = delete;
    StdioClient& operator=(const StdioClient&) = delete;

    // Starts the child and performs the initialize handshake.
    bool initialize();

    std::vector<nlohmann::json> listTools() override;
    OperationResult call(const OperationRequest& request) override;

    // Last transport failure, empty if none.
    const std::string& getLastError() const { return lastError; }

    // Pid of the running server, -1 when none.
    pid_t getServerPid() const { return childPid; }

    // Single-quote a word for /bin/sh.
    static std::string quoteArgument(const std::string& word);

private:
    std::string serverCommand;
    std::chrono::milliseconds readTimeout;
    int requestId = 0;
    int toChild = -1;
    int fromChild = -1;
    pid_t childPid = -1;
    std::string readBuffer;
    std::string lastError;

    bool startProcess();
    void stopProcess();
    bool writeLine(const std::string& line);
    bool readLine(std::string& line, const Deadline& deadline);

    // Returns the response object, or an empty object with lastError set.
    nlohmann::json sendRequest(const std::string& method, const nlohmann::json& params);
};
