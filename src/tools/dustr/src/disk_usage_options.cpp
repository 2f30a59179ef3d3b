#include "disk_usage_options.hpp"

#include <utility>

namespace dustr::du
{
namespace
{

config::OptionDefinition flag(const char *key, bool defaultValue, std::string description)
{
    config::OptionDefinition definition;
    definition.key = key;
    definition.kind = config::OptionKind::Boolean;
    definition.defaultValue = defaultValue;
    definition.description = std::move(description);
    return definition;
}

config::OptionDefinition count(const char *key, std::int64_t defaultValue, std::int64_t minimum,
                               std::int64_t maximum, std::string description)
{
    config::OptionDefinition definition;
    definition.key = key;
    definition.kind = config::OptionKind::Integer;
    definition.defaultValue = defaultValue;
    definition.description = std::move(description);
    definition.minimum = minimum;
    definition.maximum = maximum;
    return definition;
}

} // namespace

void registerDiskUsageOptions(config::OptionRegistry &registry)
{
    registry.registerOption(flag(kOptionInodes, false, "Count filesystem objects instead of kilobytes."));
    registry.registerOption(flag(kOptionGrouping, true, "Print numbers with thousands separators."));
    registry.registerOption(flag(kOptionHumanSizes, false, "Print sizes as Kb, Mb, Gb or Tb with one decimal."));
    registry.registerOption(flag(kOptionProgress, true, "Show a progress bar while scanning on a terminal."));
    registry.registerOption(flag(kOptionTypeIndicators, true, "Append / to directories and @ to symbolic links."));
    registry.registerOption(flag(kOptionReportErrors, false, "Print every entry that cannot be read while scanning."));
    registry.registerOption(count(kOptionHistogramWidth, kDefaultHistogramWidth, 1, kMaxHistogramWidth,
                                  "Number of columns used by the histogram."));
    registry.registerOption(
        count(kOptionJobs, 0, 0, kMaxJobs, "Top-level entries scanned in parallel; 0 uses every CPU."));
}

DustrOptions optionsFromRegistry(const config::OptionRegistry &registry)
{
    DustrOptions options;
    options.inodes = registry.getBool(kOptionInodes);
    options.grouping = registry.getBool(kOptionGrouping);
    options.humanSizes = registry.getBool(kOptionHumanSizes);
    options.progress = registry.getBool(kOptionProgress);
    options.typeIndicators = registry.getBool(kOptionTypeIndicators);
    options.reportErrors = registry.getBool(kOptionReportErrors);
    options.histogramWidth = static_cast<int>(registry.getInteger(kOptionHistogramWidth));
    options.jobs = static_cast<unsigned>(registry.getInteger(kOptionJobs));
    return options;
}

void storeOptions(config::OptionRegistry &registry, const DustrOptions &options)
{
    registry.setBool(kOptionInodes, options.inodes);
    registry.setBool(kOptionGrouping, options.grouping);
    registry.setBool(kOptionHumanSizes, options.humanSizes);
    registry.setBool(kOptionProgress, options.progress);
    registry.setBool(kOptionTypeIndicators, options.typeIndicators);
    registry.setBool(kOptionReportErrors, options.reportErrors);
    registry.setInteger(kOptionHistogramWidth, options.histogramWidth);
    registry.setInteger(kOptionJobs, options.jobs);
}

} // namespace dustr::du
