#include "disk_usage_core.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <mutex>
#include <optional>
#include <sys/stat.h>
#include <sys/types.h>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace dustr::du
{
namespace
{
namespace fs = std::filesystem;

struct ScanCancelled
{
};

struct Measured
{
    Metric total = 0;
    std::optional<ScanError> firstFailure;
};

struct Unreadable
{
    ScanError reason;
};

using SubtreeOutcome = std::variant<Measured, Unreadable>;

struct WalkContext
{
    UnitMode mode;
    const AggregateOptions &options;
    std::atomic<bool> &cancelled;
    std::mutex &callbackMutex;
};

std::error_code lastError()
{
    return std::error_code(errno, std::generic_category());
}

bool isPermissionDenied(const std::error_code &ec)
{
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

ScanErrorKind subtreeKindFor(const std::error_code &ec)
{
    if (isPermissionDenied(ec))
        return ScanErrorKind::SubtreePermissionDenied;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        return ScanErrorKind::SubtreeVanished;
    return ScanErrorKind::SubtreeUnreadable;
}

ScanError makeError(ScanErrorKind kind, const fs::path &path, const std::error_code &ec)
{
    ScanError error;
    error.kind = kind;
    error.message = ec.message();
    error.path = path;
    return error;
}

AggregateResult rootFailure(ScanErrorKind kind, const fs::path &root, const std::string &message)
{
    ScanError error;
    error.kind = kind;
    error.message = message;
    error.path = root;

    AggregateResult result;
    result.errors.emplace(kRootErrorKey, std::move(error));
    return result;
}

void checkCancelled(const WalkContext &context)
{
    if (context.cancelled.load(std::memory_order_relaxed))
        throw ScanCancelled{};
    if (context.options.cancelRequested && context.options.cancelRequested())
    {
        context.cancelled.store(true, std::memory_order_relaxed);
        throw ScanCancelled{};
    }
}

void reportFailure(const WalkContext &context, const fs::path &path, const std::error_code &ec)
{
    if (!context.options.reportErrors || !context.options.errorCallback)
        return;
    std::lock_guard<std::mutex> lock(context.callbackMutex);
    context.options.errorCallback(path, ec);
}

Metric leafMetric(const struct stat &sb, UnitMode mode)
{
    if (mode == UnitMode::Inodes)
        return 1;
    if (sb.st_size < 0)
        return 0;
    return kilobytesFromBytes(static_cast<std::uintmax_t>(sb.st_size));
}

void fold(Measured &into, SubtreeOutcome child)
{
    if (auto *unreadable = std::get_if<Unreadable>(&child))
    {
        if (!into.firstFailure)
            into.firstFailure = std::move(unreadable->reason);
        return;
    }

    auto &measured = std::get<Measured>(child);
    into.total += measured.total;
    if (!into.firstFailure && measured.firstFailure)
        into.firstFailure = std::move(measured.firstFailure);
}

SubtreeOutcome measureEntry(const fs::path &path, WalkContext &context);

SubtreeOutcome measureDirectory(const fs::path &path, WalkContext &context)
{
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec)
    {
        reportFailure(context, path, ec);
        return Unreadable{makeError(subtreeKindFor(ec), path, ec)};
    }

    Measured measured;
    if (context.mode == UnitMode::Inodes)
        measured.total = 1;

    for (fs::directory_iterator end; it != end; it.increment(ec))
        fold(measured, measureEntry(it->path(), context));

    // A failed increment leaves the iterator at end with ec set.
    if (ec)
    {
        reportFailure(context, path, ec);
        if (!measured.firstFailure)
            measured.firstFailure = makeError(subtreeKindFor(ec), path, ec);
    }
    return measured;
}

SubtreeOutcome measureEntry(const fs::path &path, WalkContext &context)
{
    checkCancelled(context);

    struct stat sb{};
    if (::lstat(path.c_str(), &sb) != 0)
    {
        std::error_code ec = lastError();
        reportFailure(context, path, ec);
        return Unreadable{makeError(subtreeKindFor(ec), path, ec)};
    }

    if (S_ISDIR(sb.st_mode))
        return measureDirectory(path, context);
    return Measured{leafMetric(sb, context.mode), std::nullopt};
}

unsigned effectiveJobs(unsigned requested, std::size_t workItems)
{
    unsigned jobs = requested;
    if (jobs == 0)
        jobs = std::max(1u, std::thread::hardware_concurrency());
    if (workItems < jobs)
        jobs = static_cast<unsigned>(std::max<std::size_t>(1, workItems));
    return jobs;
}

} // namespace

Metric kilobytesFromBytes(std::uintmax_t bytes) noexcept
{
    return bytes / 1024;
}

AggregateResult aggregate(const std::filesystem::path &root, UnitMode mode, const AggregateOptions &options)
{
    struct stat rootStat{};
    if (::stat(root.c_str(), &rootStat) != 0)
    {
        std::error_code ec = lastError();
        if (ec == std::errc::no_such_file_or_directory)
            return rootFailure(ScanErrorKind::RootNotFound, root, "Directory not found: " + root.string());
        if (isPermissionDenied(ec))
            return rootFailure(ScanErrorKind::RootPermissionDenied, root, ec.message());
        return rootFailure(ScanErrorKind::RootUnreadable, root, ec.message());
    }
    if (!S_ISDIR(rootStat.st_mode))
        return rootFailure(ScanErrorKind::RootNotDirectory, root, "Not a directory: " + root.string());

    std::vector<fs::path> children;
    {
        std::error_code ec;
        fs::directory_iterator it(root, ec);
        if (!ec)
        {
            for (fs::directory_iterator end; it != end; it.increment(ec))
                children.push_back(it->path());
        }
        if (ec)
        {
            if (isPermissionDenied(ec))
                return rootFailure(ScanErrorKind::RootPermissionDenied, root, ec.message());
            return rootFailure(ScanErrorKind::RootUnreadable, root, ec.message());
        }
    }

    std::vector<std::optional<SubtreeOutcome>> slots(children.size());
    std::atomic<std::size_t> nextIndex{0};
    std::atomic<bool> cancelled{false};
    std::mutex callbackMutex;
    std::size_t finished = 0;

    auto worker = [&]() {
        WalkContext context{mode, options, cancelled, callbackMutex};
        try
        {
            for (;;)
            {
                std::size_t index = nextIndex.fetch_add(1, std::memory_order_relaxed);
                if (index >= children.size())
                    break;
                slots[index] = measureEntry(children[index], context);

                std::lock_guard<std::mutex> lock(callbackMutex);
                ++finished;
                if (options.progressCallback)
                    options.progressCallback(finished, children.size());
            }
        }
        catch (const ScanCancelled &)
        {
            cancelled.store(true, std::memory_order_relaxed);
        }
    };

    std::vector<std::thread> threads;
    unsigned jobs = effectiveJobs(options.jobs, children.size());
    for (unsigned i = 1; i < jobs; ++i)
    {
        try
        {
            threads.emplace_back(worker);
        }
        catch (const std::system_error &)
        {
            // Out of threads: the remaining workers share the load.
            break;
        }
    }
    worker();
    for (auto &thread : threads)
        thread.join();

    AggregateResult result;
    result.cancelled = cancelled.load();
    for (std::size_t i = 0; i < children.size(); ++i)
    {
        if (!slots[i])
            continue;
        std::string name = children[i].filename().string();
        if (auto *unreadable = std::get_if<Unreadable>(&*slots[i]))
        {
            result.errors.emplace(name, std::move(unreadable->reason));
            continue;
        }
        auto &measured = std::get<Measured>(*slots[i]);
        result.metrics.emplace(name, measured.total);
        if (measured.firstFailure)
        {
            measured.firstFailure->partial = true;
            result.errors.emplace(name, std::move(*measured.firstFailure));
        }
    }
    return result;
}

const char *scanErrorKindName(ScanErrorKind kind) noexcept
{
    switch (kind)
    {
    case ScanErrorKind::RootNotFound:
        return "RootNotFound";
    case ScanErrorKind::RootNotDirectory:
        return "RootNotDirectory";
    case ScanErrorKind::RootPermissionDenied:
        return "RootPermissionDenied";
    case ScanErrorKind::RootUnreadable:
        return "RootUnreadable";
    case ScanErrorKind::SubtreePermissionDenied:
        return "SubtreePermissionDenied";
    case ScanErrorKind::SubtreeVanished:
        return "SubtreeVanished";
    case ScanErrorKind::SubtreeUnreadable:
        return "SubtreeUnreadable";
    case ScanErrorKind::ClassificationFailed:
        return "ClassificationFailed";
    }
    return "Unknown";
}

bool isPermissionError(ScanErrorKind kind) noexcept
{
    return kind == ScanErrorKind::RootPermissionDenied || kind == ScanErrorKind::SubtreePermissionDenied;
}

bool isRootError(ScanErrorKind kind) noexcept
{
    switch (kind)
    {
    case ScanErrorKind::RootNotFound:
    case ScanErrorKind::RootNotDirectory:
    case ScanErrorKind::RootPermissionDenied:
    case ScanErrorKind::RootUnreadable:
        return true;
    default:
        return false;
    }
}

} // namespace dustr::du
