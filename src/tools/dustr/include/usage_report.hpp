#pragma once

#include "disk_usage_core.hpp"

#include <filesystem>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace dustr::du
{

struct ReportEntry
{
    std::string name;
    std::string displayName;
    Metric metric = 0;
};

struct ReportInput
{
    std::string directory;
    UnitMode mode = UnitMode::BytesAsKilobytes;
    bool grouping = true;
    // Kilobyte totals as "N.N Kb/Mb/Gb/Tb"; ignored in inode mode.
    bool humanSizes = false;
    int histogramWidth = 20;
    std::vector<ReportEntry> entries;
    std::map<std::string, ScanError> errors;
};

/// Builds report rows from the measured children of \p directory, sorted by
/// ascending metric and then by name. With \p typeIndicators each display
/// name carries the classifier suffix of the entry; entries that cannot be
/// classified keep their bare name and are appended to \p classificationFailures.
std::vector<ReportEntry> makeReportEntries(const std::map<std::string, Metric> &metrics,
                                           const std::filesystem::path &directory, bool typeIndicators,
                                           std::vector<ScanError> *classificationFailures = nullptr);

std::string formatWithGrouping(Metric value, char separator = ',');
std::string formatMetric(Metric value, bool grouping);
std::string formatHumanSize(Metric kilobytes);
int histogramMarks(Metric size, Metric maxSize, int width);
double percentageOf(Metric size, Metric total);
std::string errorLabel(const ScanError &error);
bool reportHasPermissionErrors(const std::map<std::string, ScanError> &errors);

void renderReport(std::ostream &out, const ReportInput &input);

} // namespace dustr::du
