#pragma once

#include <chrono>
#include <functional>
#include "backtest/BacktestTypes.h"

namespace gridlab {
namespace backtest {

using BacktestJob = std::function<BacktestResult()>;

// Wall-clock limit around a backtest job. The job runs on a detached worker
// and must own everything it touches; on timeout it is abandoned.
class BacktestRunner {
public:
    explicit BacktestRunner(std::chrono::milliseconds timeout);

    // Throws BacktestTimeoutError, or whatever the job throws.
    // A non-positive timeout runs the job inline.
    BacktestResult run(BacktestJob job) const;

    static BacktestResult runWithTimeout(BacktestJob job, std::chrono::milliseconds timeout);

    // Workers started by runWithTimeout that have not finished yet
    static int liveWorkers();

    // Flushes the logs and ends the process without static destruction.
    // Required after a timeout: the abandoned worker may still be using the
    // logger and other process-wide state.
    [[noreturn]] static void exitProcess(int status);

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace backtest
} // namespace gridlab
