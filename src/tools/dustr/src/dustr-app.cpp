#include "command_line.hpp"
#include "disk_usage_core.hpp"
#include "disk_usage_options.hpp"
#include "progress_meter.hpp"
#include "usage_report.hpp"

#include "dustr/options.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

#ifndef DUSTR_VERSION
#define DUSTR_VERSION "0.0.0"
#endif

using namespace dustr::du;
namespace config = dustr::config;

namespace
{

volatile std::sig_atomic_t gInterrupted = 0;

void handleInterrupt(int)
{
    gInterrupted = 1;
}

void printUsage()
{
    std::cout << "dustr " << DUSTR_VERSION << " - show disk usage statistics\n\n"
              << "Usage: dustr [options] [dirname]\n"
              << "  -i, --inodes           Count inodes instead of kilobytes\n"
              << "  -g, --nogrouping       Do not group digits with thousands separators\n"
              << "  -H, --human            Print sizes as Kb, Mb, Gb or Tb\n"
              << "  -f, --noF              Do not append / and @ type indicators\n"
              << "      --noprogress       Do not show the progress bar\n"
              << "  -j, --jobs N           Scan N top-level entries in parallel (0 = all CPUs)\n"
              << "  -w, --width N          Histogram width in columns\n"
              << "  -v, --report-errors    Print each unreadable entry while scanning\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --save-options FILE    Save the effective options to FILE and exit\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  -h, --help             Show this help\n\n"
              << "Short flags can be combined, as in -igf.\n"
              << "Defaults are read from " << config::OptionRegistry("dustr").defaultOptionsPath().string()
              << std::endl;
}

} // namespace

int main(int argc, char **argv)
{
    auto registry = std::make_shared<config::OptionRegistry>("dustr");
    registerDiskUsageOptions(*registry);

    std::string parseError;
    auto commandLine = parseCommandLine(argc, argv, &parseError);
    if (!commandLine)
    {
        std::cerr << "dustr: " << parseError << std::endl;
        return 1;
    }
    if (commandLine->showHelp)
    {
        printUsage();
        return 0;
    }
    const std::string dirname =
        commandLine->directories.empty() ? std::string(".") : commandLine->directories.front();

    if (commandLine->loadDefaults)
    {
        std::string error;
        if (!registry->loadDefaults(&error))
            std::cerr << "dustr: ignoring saved defaults: " << error << std::endl;
    }
    for (const auto &file : commandLine->optionFiles)
    {
        std::string error;
        if (!registry->loadFromFile(file, &error))
        {
            std::cerr << "dustr: failed to load options from '" << file.string() << "': " << error << std::endl;
            return 1;
        }
    }
    applyCommandLine(*commandLine, *registry);

    DustrOptions options = optionsFromRegistry(*registry);

    if (commandLine->saveOptionsPath)
    {
        storeOptions(*registry, options);
        std::string error;
        if (!registry->saveToFile(*commandLine->saveOptionsPath, &error))
        {
            std::cerr << "dustr: failed to save options: " << error << std::endl;
            return 1;
        }
        return 0;
    }

    std::signal(SIGINT, handleInterrupt);

    ProgressMeter meter(std::cout);
    const bool showProgress = options.progress && ::isatty(STDOUT_FILENO) == 1;

    AggregateOptions scanOptions;
    scanOptions.jobs = options.jobs;
    scanOptions.reportErrors = options.reportErrors;
    scanOptions.cancelRequested = []() { return gInterrupted != 0; };
    if (showProgress)
        scanOptions.progressCallback = [&meter](std::size_t done, std::size_t total) { meter.update(done, total); };
    scanOptions.errorCallback = [&meter](const std::filesystem::path &path, const std::error_code &ec) {
        meter.clear();
        std::cerr << "dustr: cannot read '" << path.string() << "': " << ec.message() << std::endl;
    };

    AggregateResult result = aggregate(dirname, options.unitMode(), scanOptions);
    meter.clear();

    if (result.cancelled)
    {
        std::cerr << "\ndustr: interrupted by the user" << std::endl;
        return 1;
    }

    auto rootError = result.errors.find(kRootErrorKey);
    if (rootError != result.errors.end())
    {
        if (isPermissionError(rootError->second.kind))
            std::cerr << "Permission denied: Unable to access directory '" << dirname << "'" << std::endl;
        else
            std::cerr << "Error accessing directory '" << dirname << "': " << rootError->second.message << std::endl;
        return 1;
    }

    ReportInput report;
    report.directory = dirname;
    report.mode = options.unitMode();
    report.grouping = options.grouping;
    report.humanSizes = options.humanSizes;
    report.histogramWidth = options.histogramWidth;
    std::vector<ScanError> unclassified;
    report.entries = makeReportEntries(result.metrics, dirname, options.typeIndicators, &unclassified);
    report.errors = result.errors;

    if (options.reportErrors)
    {
        for (const auto &failure : unclassified)
            std::cerr << "dustr: cannot classify '" << failure.path.string() << "': " << failure.message << std::endl;
    }

    renderReport(std::cout, report);
    std::cout.flush();

    if (reportHasPermissionErrors(result.errors))
        std::cerr << "dustr has no permission to access certain subdirectories !" << std::endl;
    return 0;
}
