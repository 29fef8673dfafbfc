#include "worldgen/Automaton.hpp"
#include "worldgen/Neighbors.hpp"
#include "jobs/JobSystem.h"

#include <string>

namespace islandgen::worldgen {

namespace {

void step_row(const CellGrid& in, CellGrid& out, int y, RuleKind rule, Pcg32* rng) {
    const Cell* src = in.rowPtr(y);
    Cell*       dst = out.rowPtr(y);
    for (int x = 0; x < in.width(); ++x)
        dst[x] = apply_rule(rule, src[x], count_live_neighbors(in, x, y), rng);
}

void step_row_keyed(const CellGrid& in, CellGrid& out, int y, RuleKind rule, const Pcg32& base) {
    const Cell* src = in.rowPtr(y);
    Cell*       dst = out.rowPtr(y);
    for (int x = 0; x < in.width(); ++x) {
        Pcg32 cellRng = sub_rng(base, x, y);
        dst[x] = apply_rule(rule, src[x], count_live_neighbors(in, x, y), &cellRng);
    }
}

template <typename RowFn>
void for_each_row(int height, jobs::JobSystem* js, RowFn&& fn) {
    if (js != nullptr && js->workers() > 1 && height > 1) {
        js->ParallelForIndex(0, height, 1, [&fn](int y) { fn(y); });
        return;
    }
    for (int y = 0; y < height; ++y)
        fn(y);
}

} // namespace

const char* draw_scheme_name(DrawScheme s) noexcept {
    switch (s) {
        case DrawScheme::Sequential: return "sequential";
        case DrawScheme::PerCell:    return "per_cell";
    }
    return "unknown";
}

CellGrid step(const CellGrid& in, RuleKind rule, Pcg32* rng, const StepOptions& opt)
{
    const bool stochastic = rule_is_stochastic(rule);
    if (stochastic && rng == nullptr)
        throw ConfigError(std::string("automaton step: rule '") + rule_name(rule) +
                          "' requires a random stream");

    CellGrid out(in.width(), in.height(), kOcean);

    if (!stochastic) {
        for_each_row(in.height(), opt.jobs,
                     [&](int y) { step_row(in, out, y, rule, nullptr); });
        return out;
    }

    if (opt.scheme == DrawScheme::Sequential) {
        for (int y = 0; y < in.height(); ++y)
            step_row(in, out, y, rule, rng);
        return out;
    }

    const Pcg32 base = *rng;
    (void)rng->next();  // the next pass keys its cells off a different snapshot
    for_each_row(in.height(), opt.jobs,
                 [&](int y) { step_row_keyed(in, out, y, rule, base); });
    return out;
}

CellGrid iterate(const CellGrid& in, RuleKind rule, int iterations, Pcg32* rng, const StepOptions& opt)
{
    if (iterations < 1)
        throw ConfigError("automaton iterations must be >= 1 (got " + std::to_string(iterations) + ")");

    CellGrid cur = step(in, rule, rng, opt);
    for (int i = 1; i < iterations; ++i)
        cur = step(cur, rule, rng, opt);
    return cur;
}

} // namespace islandgen::worldgen
