#ifndef RESOURCELIMITER_HPP
#define RESOURCELIMITER_HPP

#include <QJsonObject>
#include <QVariant>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../errors/securityerror.hpp"
#include "../syntaxnode.hpp"
#include "memorymonitor.hpp"

namespace Kalkan::Core {

/**
 * @brief Ceilings enforced by a ResourceLimiter
 */
struct ResourceLimits {
    std::uint64_t maxFileSize = 10ull * 1024 * 1024;
    std::uint64_t maxTotalFileSize = 100ull * 1024 * 1024;
    std::chrono::milliseconds maxProcessingTime{30000};
    std::uint64_t maxFileCount = 1000;
    std::size_t maxConcurrentOperations = 5;
    std::uint64_t maxMemoryUsage = 500ull * 1024 * 1024;
    std::chrono::milliseconds memoryCheckInterval{1000};
    bool monitorMemory = true;
    int maxASTDepth = 50;
    std::uint64_t maxASTNodes = 10000;
    int maxDirectoryDepth = 20;
    std::uint64_t maxDirectoriesScanned = 5000;
};

/**
 * @brief Ceilings a scoped limiter sets differently from its parent
 */
struct LimitOverrides {
    std::optional<std::uint64_t> maxFileSize;
    std::optional<std::uint64_t> maxTotalFileSize;
    std::optional<std::chrono::milliseconds> maxProcessingTime;
    std::optional<std::uint64_t> maxFileCount;
    std::optional<std::size_t> maxConcurrentOperations;
    std::optional<std::uint64_t> maxMemoryUsage;
    std::optional<int> maxASTDepth;
    std::optional<std::uint64_t> maxASTNodes;
    std::optional<int> maxDirectoryDepth;
    std::optional<std::uint64_t> maxDirectoriesScanned;
};

/**
 * @brief Notification emitted by a ResourceLimiter
 */
struct ResourceEvent {
    enum class Type {
        OperationStarted,
        OperationEnded,
        FileProcessed,
        DirectoryTraversed,
        MemoryLimitExceeded,
        StatsReset
    };

    Type type;
    std::string operationId;
    std::string path;
    std::chrono::milliseconds duration{0};
    std::uint64_t size = 0;
    std::uint64_t total = 0;
    std::uint64_t totalSize = 0;
    int depth = 0;
    std::uint64_t current = 0;
    std::uint64_t limit = 0;
};

/**
 * @brief Telemetry sink for ResourceEvents
 *
 * Called outside the ledger lock, possibly from the memory sampler thread.
 */
class ResourceObserver {
public:
    virtual ~ResourceObserver() = default;
    virtual void onResourceEvent(const ResourceEvent& event) = 0;
};

/**
 * @brief Snapshot of the ledger
 */
struct UsageStats {
    struct Files {
        std::uint64_t processed = 0;
        std::uint64_t limit = 0;
        std::uint64_t sizeProcessed = 0;
        std::uint64_t sizeLimit = 0;
    } files;
    struct Operations {
        std::size_t current = 0;
        std::size_t limit = 0;
        std::vector<std::string> active;
    } operations;
    struct Directories {
        std::uint64_t scanned = 0;
        std::uint64_t limit = 0;
    } directories;
    struct Memory {
        std::uint64_t heapUsed = 0;
        std::uint64_t heapTotal = 0;
        std::uint64_t limit = 0;
        std::uint64_t initial = 0;
    } memory;

    QJsonObject toJson() const;
};

/**
 * @brief Shared usage ledger and enforcement point for resource ceilings
 *
 * All ledger mutations happen under one mutex. Every check raises
 * SecurityException on a breach.
 */
class ResourceLimiter {
public:
    explicit ResourceLimiter(ResourceLimits limits = ResourceLimits());
    ~ResourceLimiter();

    ResourceLimiter(const ResourceLimiter&) = delete;
    ResourceLimiter& operator=(const ResourceLimiter&) = delete;

    /**
     * @brief Checks a file against the per-file and cumulative size ceilings
     * @return The file size in bytes
     *
     * Does not modify the ledger.
     */
    std::uint64_t checkFileSize(const std::string& path) const;

    /**
     * @brief Admits a new operation
     * @param operationId Identifier to register; generated when empty
     * @return The registered identifier
     */
    std::string startOperation(const std::string& operationId = std::string());

    /**
     * @brief Releases an operation
     * @return Time since admission, or nothing for an unknown identifier
     */
    std::optional<std::chrono::milliseconds> endOperation(const std::string& operationId);

    /**
     * @brief Raises Timeout when the operation has run longer than maxProcessingTime
     *
     * Poll-based. Long-running callers must invoke it themselves.
     */
    void checkOperationTimeout(const std::string& operationId) const;

    void recordFileProcessed(const std::string& path, std::uint64_t size);

    /**
     * @brief Walks a tree, aborting as soon as a depth or node-count ceiling is crossed
     * @param depth Depth of `root` within an enclosing tree
     */
    TreeStats validateTree(const SyntaxNode& root, int depth = 0) const;

    /**
     * @brief Same walk over a generic tree; nodes are maps with a non-empty "type" string
     */
    TreeStats validateTree(const QVariant& root, int depth = 0) const;

    void trackDirectoryTraversal(const std::string& path, int depth);

    UsageStats usageStats() const;

    /**
     * @brief Zeroes file, byte and directory counters
     *
     * Active operations are left alone since they may still be running.
     */
    void reset();

    /**
     * @brief Derives a limiter with a stricter budget
     *
     * The child does not run its own memory sampler.
     */
    std::unique_ptr<ResourceLimiter> createScoped(const LimitOverrides& overrides) const;

    /**
     * @brief Stops the memory sampler and clears all bookkeeping; idempotent
     */
    void destroy();

    void addObserver(std::shared_ptr<ResourceObserver> observer);
    void removeObserver(const std::shared_ptr<ResourceObserver>& observer);

    const ResourceLimits& limits() const { return limits_; }
    bool isMemoryMonitorRunning() const { return monitor_ && monitor_->isRunning(); }

private:
    using Clock = std::chrono::steady_clock;

    const ResourceLimits limits_;
    const std::uint64_t initialHeapUsed_;

    mutable std::mutex mutex_;
    std::uint64_t filesProcessed_ = 0;
    std::uint64_t bytesProcessed_ = 0;
    std::uint64_t directoriesScanned_ = 0;
    std::vector<std::string> activeOperations_;
    std::unordered_map<std::string, Clock::time_point> operationStartTimes_;
    std::uint64_t nextOperationId_ = 1;
    std::vector<std::shared_ptr<ResourceObserver>> observers_;
    bool destroyed_ = false;

    std::unique_ptr<MemoryMonitor> monitor_;

    void notify(const ResourceEvent& event) const;
    void onMemoryExceeded(const MemorySample& sample);
    void walk(const SyntaxNode& node, int depth, TreeStats& stats) const;
    void walk(const QVariantMap& node, int depth, TreeStats& stats) const;
    void enterChild(int childDepth, TreeStats& stats) const;
};

/**
 * @brief Holds one admitted operation for the lifetime of a scope
 */
class OperationGuard {
public:
    explicit OperationGuard(ResourceLimiter& limiter, const std::string& operationId = std::string())
        : limiter_(limiter)
        , id_(limiter.startOperation(operationId)) {}

    ~OperationGuard() { limiter_.endOperation(id_); }

    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;

    const std::string& id() const { return id_; }

private:
    ResourceLimiter& limiter_;
    std::string id_;
};

} // namespace Kalkan::Core

#endif // RESOURCELIMITER_HPP
