#pragma once
#include <chrono>
#include <string>
#include "tools/OperationTypes.h"

/**
 * @brief Absolute steady-clock point after which an operation must stop.
 *
 * Work that can run for a long time checks the deadline between steps and
 * aborts with ErrorKind::Timeout; nothing is left running in the background.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(std::chrono::milliseconds budget)
        : budget(budget), expiresAt(Clock::now() + budget) {}

    bool expired() const { return Clock::now() >= expiresAt; }

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(expiresAt - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    std::chrono::milliseconds getBudget() const { return budget; }

    // Throws OperationError(Timeout) once the budget is spent.
    void check(const std::string& what) const {
        if (expired()) {
            throw OperationError(ErrorKind::Timeout,
                "Operation timed out after " + std::to_string(budget.count()) + "ms: " + what);
        }
    }

private:
    std::chrono::milliseconds budget;
    Clock::time_point expiresAt;
};
