#include "backtest/BacktestRunner.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <atomic>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace gridlab {
namespace backtest {

namespace {
std::atomic<int> g_live_workers{0};
}

BacktestRunner::BacktestRunner(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

BacktestResult BacktestRunner::run(BacktestJob job) const {
    return runWithTimeout(std::move(job), timeout_);
}

BacktestResult BacktestRunner::runWithTimeout(BacktestJob job, std::chrono::milliseconds timeout) {
    if (!job) {
        throw InvalidParameterError("BacktestRunner given an empty job");
    }
    if (timeout.count() <= 0) {
        return job();
    }

    auto task = std::make_shared<std::packaged_task<BacktestResult()>>(std::move(job));
    std::future<BacktestResult> result = task->get_future();
    g_live_workers.fetch_add(1);
    std::thread([task]() {
        (*task)();
        g_live_workers.fetch_sub(1);
    }).detach();

    if (result.wait_for(timeout) == std::future_status::timeout) {
        LOG_ERROR("Backtest exceeded {} ms, abandoning worker", timeout.count());
        throw BacktestTimeoutError("Backtest did not finish within " +
                                   std::to_string(timeout.count()) + " ms");
    }
    return result.get();
}

int BacktestRunner::liveWorkers() {
    return g_live_workers.load();
}

void BacktestRunner::exitProcess(int status) {
    Logger::getInstance().flush();
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(status);
}

} // namespace backtest
} // namespace gridlab
