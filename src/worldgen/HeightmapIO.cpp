#include "worldgen/HeightmapIO.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace islandgen::worldgen {

std::string heightmap_filename(std::int64_t seed)
{
    return "heightmap_" + std::to_string(seed) + ".txt";
}

std::string format_heightmap(const CellGrid& g)
{
    std::string out;
    out.reserve(static_cast<std::size_t>(g.width()) * 2u * static_cast<std::size_t>(g.height()));
    for (int y = 0; y < g.height(); ++y) {
        const Cell* row = g.rowPtr(y);
        for (int x = 0; x < g.width(); ++x) {
            if (x) out.push_back(' ');
            out.push_back(static_cast<char>('0' + row[x]));
        }
        out.push_back('\n');
    }
    return out;
}

CellGrid parse_heightmap_text(std::string_view text)
{
    std::vector<std::vector<Cell>> rows;
    std::istringstream iss{std::string(text)};
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::istringstream ls(line);
        std::vector<Cell> row;
        std::string tok;
        while (ls >> tok) {
            if (tok == "0")      row.push_back(kOcean);
            else if (tok == "1") row.push_back(kLand);
            else throw ConfigError("heightmap line " + std::to_string(lineNo) + ": bad cell '" + tok + "'");
        }
        if (row.empty()) continue;
        if (!rows.empty() && row.size() != rows.front().size())
            throw ConfigError("heightmap line " + std::to_string(lineNo) + ": expected " +
                              std::to_string(rows.front().size()) + " cells, got " + std::to_string(row.size()));
        rows.push_back(std::move(row));
    }
    if (rows.empty())
        throw ConfigError("heightmap text is empty");

    CellGrid g(static_cast<int>(rows.front().size()), static_cast<int>(rows.size()), kOcean);
    for (int y = 0; y < g.height(); ++y)
        for (int x = 0; x < g.width(); ++x)
            g.at(x, y) = rows[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
    return g;
}

void write_heightmap_text(const CellGrid& g, const fs::path& path)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            throw std::runtime_error("write_heightmap_text: cannot create " +
                                     path.parent_path().string() + ": " + ec.message());
    }

    const std::string text = format_heightmap(g);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
            throw std::runtime_error("write_heightmap_text: cannot open " + tmp.string());
        f.write(text.data(), static_cast<std::streamsize>(text.size()));
        f.flush();
        if (!f)
            throw std::runtime_error("write_heightmap_text: write failed for " + tmp.string());
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rec;
        fs::remove(tmp, rec);
        throw std::runtime_error("write_heightmap_text: cannot rename to " + path.string() + ": " + ec.message());
    }
    spdlog::debug("write_heightmap_text: {} ({}x{})", path.string(), g.width(), g.height());
}

} // namespace islandgen::worldgen
