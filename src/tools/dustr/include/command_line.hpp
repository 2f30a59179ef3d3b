#pragma once

#include "dustr/options.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dustr::du
{

// Command-line state; unset overrides leave the loaded option values alone.
struct CommandLine
{
    bool showHelp = false;
    bool loadDefaults = true;
    std::vector<std::filesystem::path> optionFiles;
    std::optional<std::filesystem::path> saveOptionsPath;

    std::optional<bool> inodes;
    std::optional<bool> grouping;
    std::optional<bool> humanSizes;
    std::optional<bool> typeIndicators;
    std::optional<bool> progress;
    std::optional<bool> reportErrors;
    std::optional<std::int64_t> jobs;
    std::optional<std::int64_t> histogramWidth;

    std::vector<std::string> directories;
};

/// Parses argv[1] .. argv[argc - 1]. Short flags may be grouped ("-ig"); -j
/// and -w take the rest of their cluster or the next argument as value. Long
/// options accept "--name VALUE" and "--name=VALUE". "--" ends option parsing.
/// Returns std::nullopt and fills \p error on bad input.
std::optional<CommandLine> parseCommandLine(int argc, const char *const *argv, std::string *error = nullptr);

void applyCommandLine(const CommandLine &commandLine, config::OptionRegistry &registry);

} // namespace dustr::du
