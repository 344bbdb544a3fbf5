#ifndef MEMORYMONITOR_HPP
#define MEMORYMONITOR_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace Kalkan::Core {

struct MemorySample {
    std::uint64_t heapUsed = 0;
    std::uint64_t heapTotal = 0;
};

/**
 * @brief Reads the allocator's view of the process heap
 */
MemorySample sampleHeap();

/**
 * @brief Asks the allocator to hand free pages back to the system
 */
void releaseFreeMemory();

/**
 * @brief Periodic heap sampler running on its own thread
 *
 * Calls `onExceeded` from the sampler thread whenever heap usage is above
 * the limit. The monitor never interrupts other work.
 */
class MemoryMonitor {
public:
    using Callback = std::function<void(const MemorySample&)>;

    MemoryMonitor(std::chrono::milliseconds interval, std::uint64_t limit, Callback onExceeded);
    ~MemoryMonitor();

    MemoryMonitor(const MemoryMonitor&) = delete;
    MemoryMonitor& operator=(const MemoryMonitor&) = delete;

    void start();
    void stop();
    bool isRunning() const { return thread_.joinable(); }

private:
    std::chrono::milliseconds interval_;
    std::uint64_t limit_;
    Callback onExceeded_;

    std::mutex mutex_;
    std::condition_variable_any wakeup_;
    std::jthread thread_;

    void run(std::stop_token stopToken);
};

} // namespace Kalkan::Core

#endif // MEMORYMONITOR_HPP
