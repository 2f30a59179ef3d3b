#pragma once

#include "disk_usage_core.hpp"

#include "dustr/options.hpp"

#include <cstdint>

namespace dustr::du
{

inline constexpr const char kOptionInodes[] = "inodes";
inline constexpr const char kOptionGrouping[] = "grouping";
inline constexpr const char kOptionHumanSizes[] = "humanSizes";
inline constexpr const char kOptionProgress[] = "progress";
inline constexpr const char kOptionTypeIndicators[] = "typeIndicators";
inline constexpr const char kOptionReportErrors[] = "reportErrors";
inline constexpr const char kOptionHistogramWidth[] = "histogramWidth";
inline constexpr const char kOptionJobs[] = "jobs";

inline constexpr std::int64_t kDefaultHistogramWidth = 20;
inline constexpr std::int64_t kMaxHistogramWidth = 200;
inline constexpr std::int64_t kMaxJobs = 256;

struct DustrOptions
{
    bool inodes = false;
    bool grouping = true;
    bool humanSizes = false;
    bool progress = true;
    bool typeIndicators = true;
    bool reportErrors = false;
    int histogramWidth = static_cast<int>(kDefaultHistogramWidth);
    unsigned jobs = 0;

    UnitMode unitMode() const noexcept { return inodes ? UnitMode::Inodes : UnitMode::BytesAsKilobytes; }
};

void registerDiskUsageOptions(config::OptionRegistry &registry);

DustrOptions optionsFromRegistry(const config::OptionRegistry &registry);
void storeOptions(config::OptionRegistry &registry, const DustrOptions &options);

} // namespace dustr::du
