#include "memorymonitor.hpp"

#include <malloc.h>

namespace Kalkan::Core {

MemorySample sampleHeap()
{
    const struct mallinfo2 info = mallinfo2();

    MemorySample sample;
    sample.heapUsed = info.uordblks + info.hblkhd;
    sample.heapTotal = info.arena + info.hblkhd;
    return sample;
}

void releaseFreeMemory()
{
    malloc_trim(0);
}

MemoryMonitor::MemoryMonitor(std::chrono::milliseconds interval, std::uint64_t limit, Callback onExceeded)
    : interval_(interval)
    , limit_(limit)
    , onExceeded_(std::move(onExceeded))
{
}

MemoryMonitor::~MemoryMonitor()
{
    stop();
}

void MemoryMonitor::start()
{
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
}

void MemoryMonitor::stop()
{
    if (!thread_.joinable()) {
        return;
    }
    thread_.request_stop();
    wakeup_.notify_all();
    thread_.join();
    thread_ = std::jthread();
}

void MemoryMonitor::run(std::stop_token stopToken)
{
    while (!stopToken.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Returns early only when a stop is requested
            wakeup_.wait_for(lock, stopToken, interval_, [] { return false; });
        }
        if (stopToken.stop_requested()) {
            break;
        }

        const MemorySample sample = sampleHeap();
        if (sample.heapUsed > limit_ && onExceeded_) {
            onExceeded_(sample);
        }
    }
}

} // namespace Kalkan::Core
