#include "usage_report.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace dustr::du
{
namespace
{

constexpr int kSizeColumnWidth = 14;
constexpr int kPercentColumnWidth = 6;
constexpr int kNameColumnWidth = 10;
// Size, percentage and the two separating blanks before the histogram.
constexpr int kErrorLabelPadding = kSizeColumnWidth + 1 + kPercentColumnWidth + 1;

struct DecimalUnit
{
    Metric kilobytes;
    const char *suffix;
};

// Decimal steps, largest first.
constexpr DecimalUnit kDecimalUnits[] = {
    {1'000'000'000, "Tb"},
    {1'000'000, "Gb"},
    {1'000, "Mb"},
    {1, "Kb"},
};

bool usesHumanSizes(const ReportInput &input)
{
    return input.humanSizes && input.mode == UnitMode::BytesAsKilobytes;
}

std::string formatQuantity(Metric value, const ReportInput &input)
{
    if (usesHumanSizes(input))
        return formatHumanSize(value);
    return formatMetric(value, input.grouping);
}

std::string columnTitle(const ReportInput &input)
{
    if (input.mode == UnitMode::Inodes)
        return "inodes";
    return usesHumanSizes(input) ? "size" : "in kByte";
}

std::string totalLine(Metric total, const ReportInput &input)
{
    if (usesHumanSizes(input))
        return formatHumanSize(total);
    return formatMetric(total, input.grouping) + (input.mode == UnitMode::Inodes ? " inodes" : " kByte");
}

std::string formatPercentage(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

void printRow(std::ostream &out, const std::string &size, const std::string &percent, const std::string &histogram,
              int histogramWidth, const std::string &name)
{
    out << std::left << std::setw(kSizeColumnWidth) << size << ' ' << std::setw(kPercentColumnWidth) << percent << ' '
        << std::setw(histogramWidth) << histogram << ' ' << std::setw(kNameColumnWidth) << name << std::right
        << '\n';
}

} // namespace

std::vector<ReportEntry> makeReportEntries(const std::map<std::string, Metric> &metrics,
                                           const std::filesystem::path &directory, bool typeIndicators,
                                           std::vector<ScanError> *classificationFailures)
{
    std::vector<ReportEntry> entries;
    entries.reserve(metrics.size());
    for (const auto &[name, metric] : metrics)
    {
        ReportEntry entry;
        entry.name = name;
        entry.displayName = name;
        if (typeIndicators)
        {
            std::optional<ScanError> failure;
            entry.displayName += displaySuffix(directory / name, &failure);
            if (failure && classificationFailures)
                classificationFailures->push_back(std::move(*failure));
        }
        entry.metric = metric;
        entries.push_back(std::move(entry));
    }

    std::stable_sort(entries.begin(), entries.end(), [](const ReportEntry &a, const ReportEntry &b) {
        if (a.metric != b.metric)
            return a.metric < b.metric;
        return a.name < b.name;
    });
    return entries;
}

std::string formatWithGrouping(Metric value, char separator)
{
    std::string digits = std::to_string(value);
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);
    const std::size_t length = digits.size();
    for (std::size_t i = 0; i < length; ++i)
    {
        if (i > 0 && (length - i) % 3 == 0)
            grouped.push_back(separator);
        grouped.push_back(digits[i]);
    }
    return grouped;
}

std::string formatMetric(Metric value, bool grouping)
{
    return grouping ? formatWithGrouping(value) : std::to_string(value);
}

std::string formatHumanSize(Metric kilobytes)
{
    const DecimalUnit *unit = &kDecimalUnits[std::size(kDecimalUnits) - 1];
    for (const auto &candidate : kDecimalUnits)
    {
        if (kilobytes >= candidate.kilobytes)
        {
            unit = &candidate;
            break;
        }
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(1)
        << static_cast<double>(kilobytes) / static_cast<double>(unit->kilobytes) << ' ' << unit->suffix;
    return out.str();
}

int histogramMarks(Metric size, Metric maxSize, int width)
{
    if (width < 1)
        width = 1;
    if (maxSize == 0)
        return width;
    long double ratio = static_cast<long double>(std::min(size, maxSize)) / static_cast<long double>(maxSize);
    return static_cast<int>((width - 1) * ratio) + 1;
}

double percentageOf(Metric size, Metric total)
{
    if (total == 0)
        return 100.0;
    return 100.0 * static_cast<double>(size) / static_cast<double>(total);
}

std::string errorLabel(const ScanError &error)
{
    if (isPermissionError(error.kind))
        return "Permission denied";
    if (error.message.empty())
        return scanErrorKindName(error.kind);
    return error.message;
}

bool reportHasPermissionErrors(const std::map<std::string, ScanError> &errors)
{
    return std::any_of(errors.begin(), errors.end(),
                       [](const auto &item) { return isPermissionError(item.second.kind); });
}

void renderReport(std::ostream &out, const ReportInput &input)
{
    const int width = std::max(1, input.histogramWidth);

    out << "Statistics of directory \"" << input.directory << "\" :\n\n";
    printRow(out, columnTitle(input), "in %", "histogram", width, "name");

    for (const auto &[key, error] : input.errors)
    {
        out << std::left << std::setw(kErrorLabelPadding + width) << errorLabel(error) << ' '
            << std::setw(kNameColumnWidth) << key << std::right << '\n';
    }

    Metric total = 0;
    Metric maxMetric = 0;
    for (const auto &entry : input.entries)
    {
        total += entry.metric;
        maxMetric = std::max(maxMetric, entry.metric);
    }

    for (const auto &entry : input.entries)
    {
        printRow(out, formatQuantity(entry.metric, input), formatPercentage(percentageOf(entry.metric, total)),
                 std::string(static_cast<std::size_t>(histogramMarks(entry.metric, maxMetric, width)), '#'), width,
                 entry.displayName);
    }

    out << "\nTotal directory size: " << totalLine(total, input) << '\n';
}

} // namespace dustr::du
