#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "worldgen/Automaton.hpp"   // DrawScheme

namespace islandgen::app {

// Parsed command-line arguments for the islandgen executable.
//
// Notes:
//   - Option names are case-sensitive.
//   - Both "--opt=value" and "--opt value" forms are supported.
//   - Values given here override the config file.
struct CommandLineArgs
{
    bool showHelp = false;                       // --help / -h

    std::optional<std::int64_t> seed;            // --seed <int64>
    std::optional<std::string>  configPath;      // --config <file.json>
    std::optional<std::string>  outDir;          // --out-dir <dir>
    std::optional<int>          startWidth;      // --size <W>x<H>
    std::optional<int>          startHeight;
    std::optional<worldgen::DrawScheme> drawScheme; // --draw-scheme sequential|per_cell
    std::optional<int>          workers;         // --workers <N>
    std::optional<std::string>  logLevel;        // --log-level trace|debug|info|warn|error|critical|off
    std::optional<std::string>  logFile;         // --log-file <path>

    // Unrecognized options, verbatim.
    std::vector<std::string> unknown;
    // "--opt: reason" for options whose value is missing or malformed.
    std::vector<std::string> invalid;
};

// argv[0] is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::optional<std::int64_t> ParseSeed(std::string_view s) noexcept;

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace islandgen::app
