#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>

namespace dustr::du
{

enum class UnitMode
{
    BytesAsKilobytes,
    Inodes
};

enum class ScanErrorKind
{
    RootNotFound,
    RootNotDirectory,
    RootPermissionDenied,
    RootUnreadable,
    SubtreePermissionDenied,
    SubtreeVanished,
    SubtreeUnreadable,
    ClassificationFailed
};

enum class TypeIndicator
{
    None,
    Directory,
    Symlink
};

using Metric = std::uintmax_t;

inline constexpr const char kRootErrorKey[] = "<root>";

struct ScanError
{
    ScanErrorKind kind = ScanErrorKind::SubtreeUnreadable;
    std::string message;
    // Entry at which the failure happened; may be nested below the key.
    std::filesystem::path path;
    // Set when the direct child was still measured and also appears in the
    // metric map with a best-effort total.
    bool partial = false;
};

struct AggregateOptions
{
    // Worker threads across direct children; 0 selects hardware concurrency.
    unsigned jobs = 1;
    std::function<void(std::size_t done, std::size_t total)> progressCallback;
    std::function<bool()> cancelRequested;
    bool reportErrors = false;
    std::function<void(const std::filesystem::path &, const std::error_code &)> errorCallback;
};

struct AggregateResult
{
    std::map<std::string, Metric> metrics;
    std::map<std::string, ScanError> errors;
    bool cancelled = false;

    bool ok() const noexcept { return !cancelled && errors.find(kRootErrorKey) == errors.end(); }
};

AggregateResult aggregate(const std::filesystem::path &root, UnitMode mode,
                          const AggregateOptions &options = {});

TypeIndicator classify(const std::filesystem::path &path, std::error_code &ec);
const char *typeIndicatorSuffix(TypeIndicator indicator) noexcept;
// Suffix for \p path, or "" when the lookup fails. A failed lookup is
// described in \p failure as ClassificationFailed when one is given.
std::string displaySuffix(const std::filesystem::path &path, std::optional<ScanError> *failure = nullptr);

const char *scanErrorKindName(ScanErrorKind kind) noexcept;
bool isPermissionError(ScanErrorKind kind) noexcept;
bool isRootError(ScanErrorKind kind) noexcept;

Metric kilobytesFromBytes(std::uintmax_t bytes) noexcept;

} // namespace dustr::du
