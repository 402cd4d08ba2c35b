#pragma once
#include <optional>
#include <string>
#include <vector>
#include "tools/OperationTypes.h"

enum class LoopPhase {
    AwaitingModel,
    ExecutingOperation,
    Done
};

/**
 * @brief One executed (or dry-run) operation and what came back.
 */
struct TranscriptEntry {
    OperationRequest request;
    OperationResult result;
    bool dryRun = false;
};

/**
 * @brief State of one goal-to-completion session.
 *
 * The transcript only grows; entries are never edited after record().
 */
struct SessionState {
    std::string goal;
    LoopPhase phase = LoopPhase::AwaitingModel;
    std::vector<TranscriptEntry> transcript;
    bool finished = false;
    std::optional<std::string> finalText;

    // Operations executed so far, dry-run ones included.
    int turns = 0;
    bool turnLimitReached = false;

    void record(const OperationRequest& request, const OperationResult& result, bool dryRun = false) {
        transcript.push_back({request, result, dryRun});
        turns++;
    }
};

/**
 * @brief What the caller gets back from DispatchLoop::run.
 *
 * ok is false only for fatal errors and interruption; recoverable operation
 * failures stay in the transcript and the session continues.
 */
struct SessionOutcome {
    bool ok = false;
    std::string finalText;
    ErrorKind error = ErrorKind::Unknown;
    std::string message;
    int turns = 0;
    bool turnLimitReached = false;
    bool cancelled = false;
};
