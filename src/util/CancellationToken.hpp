#pragma once

#include <atomic>
#include <memory>

namespace hashflow {

/**
 * @brief Shared cancel flag handed to a pipeline
 *
 * Copies share one flag. The scheduler keeps one copy per tracked file and
 * cancels it on remove(); the pipeline checks its copy between chunks and
 * before every send.
 */
class CancellationToken {
public:
    CancellationToken() : flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}
