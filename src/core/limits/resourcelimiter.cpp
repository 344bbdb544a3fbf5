#include "resourcelimiter.hpp"
#include "../logging.hpp"

#include <QJsonArray>
#include <QVariantList>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace Kalkan::Core {

namespace {

SecurityError limitError(ErrorKind kind, const char* code, const std::string& message,
                         std::int64_t limit, std::int64_t observed, const std::string& context = std::string())
{
    SecurityError error(kind, code, message, context);
    error.withLimit(limit, observed);
    return error;
}

bool isTreeNode(const QVariant& value)
{
    if (value.typeId() != QMetaType::QVariantMap) {
        return false;
    }
    const QVariant type = value.toMap().value(QStringLiteral("type"));
    return type.typeId() == QMetaType::QString && !type.toString().isEmpty();
}

} // namespace

QJsonObject UsageStats::toJson() const
{
    QJsonArray active;
    for (const auto& id : operations.active) {
        active.append(QString::fromStdString(id));
    }

    return QJsonObject{
        {QStringLiteral("files"), QJsonObject{
            {QStringLiteral("processed"), static_cast<qint64>(files.processed)},
            {QStringLiteral("limit"), static_cast<qint64>(files.limit)},
            {QStringLiteral("sizeProcessed"), static_cast<qint64>(files.sizeProcessed)},
            {QStringLiteral("sizeLimit"), static_cast<qint64>(files.sizeLimit)},
        }},
        {QStringLiteral("operations"), QJsonObject{
            {QStringLiteral("current"), static_cast<qint64>(operations.current)},
            {QStringLiteral("limit"), static_cast<qint64>(operations.limit)},
            {QStringLiteral("active"), active},
        }},
        {QStringLiteral("directories"), QJsonObject{
            {QStringLiteral("scanned"), static_cast<qint64>(directories.scanned)},
            {QStringLiteral("limit"), static_cast<qint64>(directories.limit)},
        }},
        {QStringLiteral("memory"), QJsonObject{
            {QStringLiteral("heapUsed"), static_cast<qint64>(memory.heapUsed)},
            {QStringLiteral("heapTotal"), static_cast<qint64>(memory.heapTotal)},
            {QStringLiteral("limit"), static_cast<qint64>(memory.limit)},
            {QStringLiteral("initial"), static_cast<qint64>(memory.initial)},
        }},
    };
}

ResourceLimiter::ResourceLimiter(ResourceLimits limits)
    : limits_(limits)
    , initialHeapUsed_(sampleHeap().heapUsed)
{
    if (limits_.monitorMemory) {
        monitor_ = std::make_unique<MemoryMonitor>(
            limits_.memoryCheckInterval, limits_.maxMemoryUsage,
            [this](const MemorySample& sample) { onMemoryExceeded(sample); });
        monitor_->start();
    }
}

ResourceLimiter::~ResourceLimiter()
{
    destroy();
}

std::uint64_t ResourceLimiter::checkFileSize(const std::string& path) const
{
    std::error_code ec;
    const std::uint64_t fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        throw SecurityException(ErrorKind::ResourceExceeded, "FILE_ACCESS_ERROR",
                                "Cannot check file size: " + ec.message(), path);
    }

    if (fileSize > limits_.maxFileSize) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "FILE_TOO_LARGE",
                                           "File size " + std::to_string(fileSize) + " bytes exceeds maximum allowed "
                                               + std::to_string(limits_.maxFileSize) + " bytes",
                                           static_cast<std::int64_t>(limits_.maxFileSize),
                                           static_cast<std::int64_t>(fileSize), path));
    }

    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = bytesProcessed_ + fileSize;
    }

    if (total > limits_.maxTotalFileSize) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "TOTAL_SIZE_EXCEEDED",
                                           "Total processing size would exceed limit of "
                                               + std::to_string(limits_.maxTotalFileSize) + " bytes",
                                           static_cast<std::int64_t>(limits_.maxTotalFileSize),
                                           static_cast<std::int64_t>(total), path));
    }

    return fileSize;
}

std::string ResourceLimiter::startOperation(const std::string& operationId)
{
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (activeOperations_.size() >= limits_.maxConcurrentOperations) {
            qCWarning(lcLimiter) << "Admission refused," << activeOperations_.size() << "operations active";
            throw SecurityException(limitError(ErrorKind::ResourceExceeded, "TOO_MANY_OPERATIONS",
                                               "Maximum concurrent operations ("
                                                   + std::to_string(limits_.maxConcurrentOperations) + ") exceeded",
                                               static_cast<std::int64_t>(limits_.maxConcurrentOperations),
                                               static_cast<std::int64_t>(activeOperations_.size())));
        }

        id = operationId.empty() ? "op_" + std::to_string(nextOperationId_++) : operationId;
        if (operationStartTimes_.count(id) != 0) {
            throw SecurityException(ErrorKind::InvalidInput, "DUPLICATE_OPERATION",
                                    "Operation is already registered", id);
        }

        activeOperations_.push_back(id);
        operationStartTimes_.emplace(id, Clock::now());
    }

    ResourceEvent event{ResourceEvent::Type::OperationStarted};
    event.operationId = id;
    notify(event);
    return id;
}

std::optional<std::chrono::milliseconds> ResourceLimiter::endOperation(const std::string& operationId)
{
    std::optional<std::chrono::milliseconds> duration;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        activeOperations_.erase(std::remove(activeOperations_.begin(), activeOperations_.end(), operationId),
                                activeOperations_.end());
        auto it = operationStartTimes_.find(operationId);
        if (it != operationStartTimes_.end()) {
            duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - it->second);
            operationStartTimes_.erase(it);
        }
    }

    if (duration) {
        ResourceEvent event{ResourceEvent::Type::OperationEnded};
        event.operationId = operationId;
        event.duration = *duration;
        notify(event);
    }
    return duration;
}

void ResourceLimiter::checkOperationTimeout(const std::string& operationId) const
{
    std::chrono::milliseconds elapsed{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = operationStartTimes_.find(operationId);
        if (it == operationStartTimes_.end()) {
            return;
        }
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - it->second);
    }

    if (elapsed > limits_.maxProcessingTime) {
        throw SecurityException(limitError(ErrorKind::Timeout, "OPERATION_TIMEOUT",
                                           "Operation " + operationId + " exceeded maximum processing time of "
                                               + std::to_string(limits_.maxProcessingTime.count()) + "ms",
                                           limits_.maxProcessingTime.count(), elapsed.count(), operationId));
    }
}

void ResourceLimiter::recordFileProcessed(const std::string& path, std::uint64_t size)
{
    ResourceEvent event{ResourceEvent::Type::FileProcessed};
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Check before commit: a rejected file is not counted
        if (filesProcessed_ + 1 > limits_.maxFileCount) {
            throw SecurityException(limitError(ErrorKind::ResourceExceeded, "TOO_MANY_FILES",
                                               "Maximum file count (" + std::to_string(limits_.maxFileCount) + ") exceeded",
                                               static_cast<std::int64_t>(limits_.maxFileCount),
                                               static_cast<std::int64_t>(filesProcessed_ + 1), path));
        }

        ++filesProcessed_;
        bytesProcessed_ += size;
        event.total = filesProcessed_;
        event.totalSize = bytesProcessed_;
    }

    event.path = path;
    event.size = size;
    notify(event);
}

TreeStats ResourceLimiter::validateTree(const SyntaxNode& root, int depth) const
{
    if (depth > limits_.maxASTDepth) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "AST_TOO_DEEP",
                                           "AST depth " + std::to_string(depth) + " exceeds maximum allowed depth of "
                                               + std::to_string(limits_.maxASTDepth),
                                           limits_.maxASTDepth, depth));
    }

    TreeStats stats{1, depth};
    walk(root, depth, stats);
    return stats;
}

TreeStats ResourceLimiter::validateTree(const QVariant& root, int depth) const
{
    if (depth > limits_.maxASTDepth) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "AST_TOO_DEEP",
                                           "AST depth " + std::to_string(depth) + " exceeds maximum allowed depth of "
                                               + std::to_string(limits_.maxASTDepth),
                                           limits_.maxASTDepth, depth));
    }

    TreeStats stats{1, depth};
    if (root.typeId() == QMetaType::QVariantMap) {
        walk(root.toMap(), depth, stats);
    }
    return stats;
}

void ResourceLimiter::enterChild(int childDepth, TreeStats& stats) const
{
    if (childDepth > limits_.maxASTDepth) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "AST_TOO_DEEP",
                                           "AST depth " + std::to_string(childDepth) + " exceeds maximum allowed depth of "
                                               + std::to_string(limits_.maxASTDepth),
                                           limits_.maxASTDepth, childDepth));
    }

    ++stats.nodeCount;
    if (stats.nodeCount > limits_.maxASTNodes) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "AST_TOO_COMPLEX",
                                           "AST node count " + std::to_string(stats.nodeCount)
                                               + " exceeds maximum allowed nodes of " + std::to_string(limits_.maxASTNodes),
                                           static_cast<std::int64_t>(limits_.maxASTNodes),
                                           static_cast<std::int64_t>(stats.nodeCount)));
    }

    stats.maxDepth = std::max(stats.maxDepth, childDepth);
}

void ResourceLimiter::walk(const SyntaxNode& node, int depth, TreeStats& stats) const
{
    for (const auto& child : node.children) {
        enterChild(depth + 1, stats);
        walk(*child, depth + 1, stats);
    }
}

void ResourceLimiter::walk(const QVariantMap& node, int depth, TreeStats& stats) const
{
    for (auto it = node.cbegin(); it != node.cend(); ++it) {
        const QVariant& value = it.value();
        if (value.typeId() == QMetaType::QVariantList) {
            const QVariantList items = value.toList();
            for (const QVariant& item : items) {
                if (isTreeNode(item)) {
                    enterChild(depth + 1, stats);
                    walk(item.toMap(), depth + 1, stats);
                }
            }
        } else if (isTreeNode(value)) {
            enterChild(depth + 1, stats);
            walk(value.toMap(), depth + 1, stats);
        }
    }
}

void ResourceLimiter::trackDirectoryTraversal(const std::string& path, int depth)
{
    if (depth > limits_.maxDirectoryDepth) {
        throw SecurityException(limitError(ErrorKind::ResourceExceeded, "DIRECTORY_TOO_DEEP",
                                           "Directory traversal depth " + std::to_string(depth)
                                               + " exceeds maximum allowed depth of " + std::to_string(limits_.maxDirectoryDepth),
                                           limits_.maxDirectoryDepth, depth, path));
    }

    ResourceEvent event{ResourceEvent::Type::DirectoryTraversed};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (directoriesScanned_ + 1 > limits_.maxDirectoriesScanned) {
            throw SecurityException(limitError(ErrorKind::ResourceExceeded, "TOO_MANY_DIRECTORIES",
                                               "Number of directories scanned exceeds maximum allowed "
                                                   + std::to_string(limits_.maxDirectoriesScanned),
                                               static_cast<std::int64_t>(limits_.maxDirectoriesScanned),
                                               static_cast<std::int64_t>(directoriesScanned_ + 1), path));
        }
        ++directoriesScanned_;
        event.total = directoriesScanned_;
    }

    event.path = path;
    event.depth = depth;
    notify(event);
}

UsageStats ResourceLimiter::usageStats() const
{
    const MemorySample heap = sampleHeap();

    UsageStats stats;
    stats.files.limit = limits_.maxFileCount;
    stats.files.sizeLimit = limits_.maxTotalFileSize;
    stats.operations.limit = limits_.maxConcurrentOperations;
    stats.directories.limit = limits_.maxDirectoriesScanned;
    stats.memory.heapUsed = heap.heapUsed;
    stats.memory.heapTotal = heap.heapTotal;
    stats.memory.limit = limits_.maxMemoryUsage;
    stats.memory.initial = initialHeapUsed_;

    std::lock_guard<std::mutex> lock(mutex_);
    stats.files.processed = filesProcessed_;
    stats.files.sizeProcessed = bytesProcessed_;
    stats.operations.current = activeOperations_.size();
    stats.operations.active = activeOperations_;
    stats.directories.scanned = directoriesScanned_;
    return stats;
}

void ResourceLimiter::reset()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filesProcessed_ = 0;
        bytesProcessed_ = 0;
        directoriesScanned_ = 0;
    }
    notify(ResourceEvent{ResourceEvent::Type::StatsReset});
}

std::unique_ptr<ResourceLimiter> ResourceLimiter::createScoped(const LimitOverrides& overrides) const
{
    ResourceLimits scoped = limits_;
    scoped.maxFileSize = overrides.maxFileSize.value_or(limits_.maxFileSize);
    scoped.maxTotalFileSize = overrides.maxTotalFileSize.value_or(limits_.maxTotalFileSize);
    scoped.maxProcessingTime = overrides.maxProcessingTime.value_or(limits_.maxProcessingTime);
    scoped.maxFileCount = overrides.maxFileCount.value_or(limits_.maxFileCount);
    scoped.maxConcurrentOperations = overrides.maxConcurrentOperations.value_or(limits_.maxConcurrentOperations);
    scoped.maxMemoryUsage = overrides.maxMemoryUsage.value_or(limits_.maxMemoryUsage);
    scoped.maxASTDepth = overrides.maxASTDepth.value_or(limits_.maxASTDepth);
    scoped.maxASTNodes = overrides.maxASTNodes.value_or(limits_.maxASTNodes);
    scoped.maxDirectoryDepth = overrides.maxDirectoryDepth.value_or(limits_.maxDirectoryDepth);
    scoped.maxDirectoriesScanned = overrides.maxDirectoriesScanned.value_or(limits_.maxDirectoriesScanned);
    scoped.monitorMemory = false;
    return std::make_unique<ResourceLimiter>(scoped);
}

void ResourceLimiter::destroy()
{
    // The sampler calls back into this object, stop it before clearing
    if (monitor_) {
        monitor_->stop();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        return;
    }
    activeOperations_.clear();
    operationStartTimes_.clear();
    observers_.clear();
    destroyed_ = true;
    qCDebug(lcLimiter) << "Limiter destroyed";
}

void ResourceLimiter::addObserver(std::shared_ptr<ResourceObserver> observer)
{
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void ResourceLimiter::removeObserver(const std::shared_ptr<ResourceObserver>& observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void ResourceLimiter::notify(const ResourceEvent& event) const
{
    std::vector<std::shared_ptr<ResourceObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        observer->onResourceEvent(event);
    }
}

void ResourceLimiter::onMemoryExceeded(const MemorySample& sample)
{
    qCWarning(lcLimiter) << "Heap usage" << sample.heapUsed << "above limit" << limits_.maxMemoryUsage;

    ResourceEvent event{ResourceEvent::Type::MemoryLimitExceeded};
    event.current = sample.heapUsed;
    event.limit = limits_.maxMemoryUsage;
    notify(event);

    releaseFreeMemory();
}

} // namespace Kalkan::Core
