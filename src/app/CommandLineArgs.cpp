#include "app/CommandLineArgs.h"

#include <charconv>
#include <sstream>
#include <system_error>

namespace islandgen::app {

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value" -> value
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (!StartsWith(arg, prefix) || arg.size() == prefix.size() || arg[prefix.size()] != '=')
        return false;
    outValue = arg.substr(prefix.size() + 1);
    return true;
}

template <typename Int>
[[nodiscard]] std::optional<Int> ParseInteger(std::string_view s) noexcept
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;
    Int v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

[[nodiscard]] bool ParseSize(std::string_view s, int& w, int& h) noexcept
{
    const auto x = s.find_first_of("xX");
    if (x == std::string_view::npos)
        return false;
    const auto pw = ParseInteger<int>(s.substr(0, x));
    const auto ph = ParseInteger<int>(s.substr(x + 1));
    if (!pw || !ph || *pw < 1 || *ph < 1)
        return false;
    w = *pw;
    h = *ph;
    return true;
}

} // namespace

std::optional<std::int64_t> ParseSeed(std::string_view s) noexcept
{
    return ParseInteger<std::int64_t>(s);
}

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    struct Option {
        std::string_view name;
        std::string_view alias;
    };
    constexpr Option kValueOptions[] = {
        {"--seed", "-s"},
        {"--config", "-c"},
        {"--out-dir", "-o"},
        {"--size", ""},
        {"--draw-scheme", ""},
        {"--workers", "-j"},
        {"--log-level", ""},
        {"--log-file", ""},
    };

    const auto apply = [&out](std::string_view opt, std::string_view value) {
        const auto fail = [&](const char* why) { out.invalid.push_back(std::string(opt) + ": " + why); };

        if (opt == "--seed") {
            if (auto v = ParseSeed(value)) out.seed = *v;
            else fail("expected a signed 64-bit integer");
        } else if (opt == "--config") {
            out.configPath = std::string(value);
        } else if (opt == "--out-dir") {
            out.outDir = std::string(value);
        } else if (opt == "--size") {
            int w = 0, h = 0;
            if (ParseSize(value, w, h)) { out.startWidth = w; out.startHeight = h; }
            else fail("expected <W>x<H> with positive integers");
        } else if (opt == "--draw-scheme") {
            if (value == "sequential")    out.drawScheme = worldgen::DrawScheme::Sequential;
            else if (value == "per_cell") out.drawScheme = worldgen::DrawScheme::PerCell;
            else fail("expected 'sequential' or 'per_cell'");
        } else if (opt == "--workers") {
            const auto v = ParseInteger<int>(value);
            if (v && *v >= 1) out.workers = *v;
            else fail("expected an integer >= 1");
        } else if (opt == "--log-level") {
            out.logLevel = std::string(value);
        } else if (opt == "--log-file") {
            out.logFile = std::string(value);
        }
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view arg = argv[i];
        if (arg.empty())
            continue;

        if (arg == "--help" || arg == "-h") {
            out.showHelp = true;
            continue;
        }

        bool handled = false;
        for (const Option& o : kValueOptions)
        {
            std::string_view value;
            if (arg == o.name || (!o.alias.empty() && arg == o.alias)) {
                if (i + 1 >= argv.size())
                    out.invalid.push_back(std::string(o.name) + ": missing value");
                else
                    apply(o.name, argv[++i]);
                handled = true;
                break;
            }
            if (ConsumeValue(arg, o.name, value)) {
                apply(o.name, value);
                handled = true;
                break;
            }
        }

        if (!handled)
            out.unknown.emplace_back(arg);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "islandgen - grow a land/ocean heightmap from a seed\n\n";
    oss << "Usage: islandgen --seed <N> [options]\n\n";
    oss << "Generation\n";
    oss << "  --seed, -s <N>                 Signed 64-bit seed (required unless the config has one)\n";
    oss << "  --config, -c <file.json>       Pipeline config (stages, start size, scheme)\n";
    oss << "  --size <W>x<H>                 Seed grid size (default 4x4)\n";
    oss << "  --draw-scheme <name>           sequential (default) | per_cell\n";
    oss << "  --workers, -j <N>              Worker threads for automaton passes (default 1)\n\n";
    oss << "Output\n";
    oss << "  --out-dir, -o <dir>            Where heightmap_<seed>.txt is written (default .)\n\n";
    oss << "Logging\n";
    oss << "  --log-level <lvl>              trace|debug|info|warn|error|critical|off (default info)\n";
    oss << "  --log-file <path>              Also log to a rotating file\n\n";
    oss << "Misc\n";
    oss << "  --help, -h                     Show this help\n\n";
    oss << "Examples\n";
    oss << "  islandgen --seed 42\n";
    oss << "  islandgen --seed -7 --config assets/config/islandgen.json --out-dir out\n";
    oss << "  islandgen --seed 1 --draw-scheme per_cell --workers 8\n";
    return oss.str();
}

} // namespace islandgen::app
