#include "command_line.hpp"

#include "disk_usage_options.hpp"

#include <utility>

namespace dustr::du
{
namespace
{

std::optional<CommandLine> reject(std::string *error, std::string message)
{
    if (error)
        *error = std::move(message);
    return std::nullopt;
}

// --jobs takes 0 and up, --width 1 and up.
std::optional<std::int64_t> parseCount(const std::string &name, const std::optional<std::string> &value,
                                       std::string *error)
{
    if (!value)
    {
        if (error)
            *error = name + " requires a number";
        return std::nullopt;
    }
    auto parsed = config::parseInteger(*value);
    const std::int64_t minimum = name == "--jobs" ? 0 : 1;
    if (!parsed || *parsed < minimum)
    {
        if (error)
            *error = "invalid value '" + *value + "' for " + name;
        return std::nullopt;
    }
    return parsed;
}

} // namespace

std::optional<CommandLine> parseCommandLine(int argc, const char *const *argv, std::string *error)
{
    CommandLine commandLine;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--")
        {
            for (++i; i < argc; ++i)
                commandLine.directories.emplace_back(argv[i]);
            break;
        }

        if (arg.size() > 2 && arg.rfind("--", 0) == 0)
        {
            std::string name = arg;
            std::optional<std::string> inlineValue;
            if (auto eq = arg.find('='); eq != std::string::npos)
            {
                name = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }
            auto takeValue = [&]() -> std::optional<std::string> {
                if (inlineValue)
                    return inlineValue;
                if (i + 1 >= argc)
                    return std::nullopt;
                return std::string(argv[++i]);
            };

            if (name == "--help")
                commandLine.showHelp = true;
            else if (name == "--inodes")
                commandLine.inodes = true;
            else if (name == "--nogrouping")
                commandLine.grouping = false;
            else if (name == "--human")
                commandLine.humanSizes = true;
            else if (name == "--noF")
                commandLine.typeIndicators = false;
            else if (name == "--noprogress")
                commandLine.progress = false;
            else if (name == "--report-errors")
                commandLine.reportErrors = true;
            else if (name == "--no-default-options")
                commandLine.loadDefaults = false;
            else if (name == "--load-options" || name == "--save-options")
            {
                auto value = takeValue();
                if (!value || value->empty())
                    return reject(error, name + " requires a file path");
                if (name == "--load-options")
                    commandLine.optionFiles.emplace_back(*value);
                else
                    commandLine.saveOptionsPath = *value;
            }
            else if (name == "--jobs" || name == "--width")
            {
                auto parsed = parseCount(name, takeValue(), error);
                if (!parsed)
                    return std::nullopt;
                if (name == "--jobs")
                    commandLine.jobs = *parsed;
                else
                    commandLine.histogramWidth = *parsed;
            }
            else
            {
                return reject(error, "unknown option '" + arg + "'");
            }
            continue;
        }

        if (arg.size() < 2 || arg[0] != '-')
        {
            commandLine.directories.push_back(arg);
            continue;
        }

        for (std::size_t j = 1; j < arg.size(); ++j)
        {
            const char opt = arg[j];
            switch (opt)
            {
            case 'h':
                commandLine.showHelp = true;
                break;
            case 'i':
                commandLine.inodes = true;
                break;
            case 'g':
                commandLine.grouping = false;
                break;
            case 'H':
                commandLine.humanSizes = true;
                break;
            case 'f':
                commandLine.typeIndicators = false;
                break;
            case 'v':
                commandLine.reportErrors = true;
                break;
            case 'j':
            case 'w':
            {
                std::optional<std::string> value;
                if (j + 1 < arg.size())
                    value = arg.substr(j + 1);
                else if (i + 1 < argc)
                    value = std::string(argv[++i]);
                j = arg.size();

                auto parsed = parseCount(opt == 'j' ? "--jobs" : "--width", value, error);
                if (!parsed)
                    return std::nullopt;
                if (opt == 'j')
                    commandLine.jobs = *parsed;
                else
                    commandLine.histogramWidth = *parsed;
                break;
            }
            default:
                return reject(error, std::string("unknown option '-") + opt + "'");
            }
        }
    }

    if (commandLine.directories.size() > 1)
        return reject(error, "only one directory may be given");
    return commandLine;
}

void applyCommandLine(const CommandLine &commandLine, config::OptionRegistry &registry)
{
    auto applyFlag = [&registry](const char *key, const std::optional<bool> &value) {
        if (value)
            registry.setBool(key, *value);
    };
    applyFlag(kOptionInodes, commandLine.inodes);
    applyFlag(kOptionGrouping, commandLine.grouping);
    applyFlag(kOptionHumanSizes, commandLine.humanSizes);
    applyFlag(kOptionTypeIndicators, commandLine.typeIndicators);
    applyFlag(kOptionProgress, commandLine.progress);
    applyFlag(kOptionReportErrors, commandLine.reportErrors);

    if (commandLine.jobs)
        registry.setInteger(kOptionJobs, *commandLine.jobs);
    if (commandLine.histogramWidth)
        registry.setInteger(kOptionHistogramWidth, *commandLine.histogramWidth);
}

} // namespace dustr::du
