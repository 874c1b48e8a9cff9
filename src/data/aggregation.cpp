#include <telechart/data/aggregation.hpp>
#include <telechart/data/stats.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace telechart::data
{

const char* reducer_name(Reducer reducer)
{
    switch (reducer)
    {
        case Reducer::Mean:
            return "mean";
        case Reducer::Sum:
            return "sum";
        case Reducer::Min:
            return "min";
        case Reducer::Max:
            return "max";
        case Reducer::Count:
            return "count";
    }
    return "unknown";
}

Reducer parse_reducer(std::string_view name)
{
    if (name == "mean" || name == "avg")
        return Reducer::Mean;
    if (name == "sum")
        return Reducer::Sum;
    if (name == "min")
        return Reducer::Min;
    if (name == "max")
        return Reducer::Max;
    if (name == "count")
        return Reducer::Count;
    throw std::invalid_argument("Unknown reducer: " + std::string(name));
}

double reduce(std::span<const double> values, Reducer reducer)
{
    const auto finite = finite_values(values);
    if (finite.empty())
        return 0.0;

    switch (reducer)
    {
        case Reducer::Mean:
            return *mean(finite);
        case Reducer::Sum:
        {
            double sum = 0.0;
            for (double v : finite)
                sum += v;
            return sum;
        }
        case Reducer::Min:
            return *std::min_element(finite.begin(), finite.end());
        case Reducer::Max:
            return *std::max_element(finite.begin(), finite.end());
        case Reducer::Count:
            return static_cast<double>(finite.size());
    }
    return 0.0;
}

// Most frequent category; ties go to the one seen first.
static std::optional<std::string> majority_category(std::span<const Sample> window)
{
    std::vector<std::pair<std::string, std::size_t>> tally;
    for (const auto& s : window)
    {
        if (!s.category)
            continue;
        auto it = std::find_if(tally.begin(),
                               tally.end(),
                               [&](const auto& entry) { return entry.first == *s.category; });
        if (it == tally.end())
            tally.emplace_back(*s.category, 1);
        else
            ++it->second;
    }
    if (tally.empty())
        return std::nullopt;

    auto best = tally.begin();
    for (auto it = tally.begin() + 1; it != tally.end(); ++it)
    {
        if (it->second > best->second)
            best = it;
    }
    return best->first;
}

Series aggregate_by_window(std::span<const Sample> series, double window_ms, Reducer reducer)
{
    if (!(window_ms > 0.0) || !std::isfinite(window_ms))
        throw std::invalid_argument("aggregate_by_window: window_ms must be positive");

    Series s = prepare(series);
    if (s.empty())
        return {};

    const double origin = std::floor(s.front().time);

    Series      out;
    std::size_t begin = 0;
    while (begin < s.size())
    {
        auto   index        = std::floor((s[begin].time - origin) / window_ms);
        double window_start = origin + index * window_ms;
        double window_end   = window_start + window_ms;

        // The quotient can round one window low.
        if (!(window_end > s[begin].time))
        {
            index += 1.0;
            window_start = origin + index * window_ms;
            window_end   = window_start + window_ms;
        }
        // Window below the spacing of representable times near this sample.
        if (!(window_end > s[begin].time) || !(window_end > window_start))
            throw std::invalid_argument(
                "aggregate_by_window: window_ms is below the time resolution of the series");

        std::size_t end = begin;
        while (end < s.size() && s[end].time < window_end)
            ++end;

        const std::span<const Sample> window(s.data() + begin, end - begin);
        const auto                    values = values_of(window);

        Sample bucket;
        bucket.time                     = window_start + window_ms / 2.0;
        bucket.value                    = reduce(values, reducer);
        bucket.category                 = majority_category(window);
        bucket.metadata["count"]        = static_cast<double>(window.size());
        bucket.metadata["window_start"] = window_start;
        bucket.metadata["window_end"]   = window_end;
        out.push_back(std::move(bucket));

        begin = end;
    }
    return out;
}

std::vector<Bin> bin_values(std::span<const double>                  values,
                            std::size_t                              bin_count,
                            std::optional<std::pair<double, double>> domain)
{
    const auto finite = finite_values(values);
    if (finite.empty() || bin_count == 0)
        return {};

    auto extent = domain ? domain : min_max(finite);
    auto [lo, hi] = *extent;
    if (lo > hi)
        std::swap(lo, hi);

    if (hi - lo <= 0.0)
    {
        Bin only{lo, hi, 0};
        for (double v : finite)
        {
            if (v == lo)
                ++only.count;
        }
        return {only};
    }

    const double     width = (hi - lo) / static_cast<double>(bin_count);
    std::vector<Bin> bins(bin_count);
    for (std::size_t i = 0; i < bin_count; ++i)
    {
        bins[i].x0 = lo + static_cast<double>(i) * width;
        bins[i].x1 = (i + 1 == bin_count) ? hi : lo + static_cast<double>(i + 1) * width;
    }

    for (double v : finite)
    {
        if (v < lo || v > hi)
            continue;
        auto idx = static_cast<std::size_t>((v - lo) / width);
        if (idx >= bin_count)
            idx = bin_count - 1;
        ++bins[idx].count;
    }
    return bins;
}

std::vector<GridCell> pivot(std::span<const PivotRecord> records, Reducer reducer)
{
    struct Group
    {
        std::string         row;
        std::string         column;
        std::vector<double> values;
    };

    std::vector<Group>                                        groups;
    std::map<std::pair<std::string, std::string>, std::size_t> index;
    for (const auto& r : records)
    {
        auto key = std::make_pair(r.row, r.column);
        auto it  = index.find(key);
        if (it == index.end())
        {
            index.emplace(key, groups.size());
            groups.push_back({r.row, r.column, {r.value}});
        }
        else
        {
            groups[it->second].values.push_back(r.value);
        }
    }

    std::vector<GridCell> cells;
    cells.reserve(groups.size());
    for (const auto& g : groups)
        cells.push_back({g.column, g.row, reduce(g.values, reducer)});
    return cells;
}

std::vector<GridCell> correlation_matrix(std::span<const NamedColumn> columns)
{
    const std::size_t   n = columns.size();
    std::vector<double> coeff(n * n, 0.0);
    for (std::size_t i = 0; i < n; ++i)
    {
        coeff[i * n + i] = 1.0;
        for (std::size_t j = i + 1; j < n; ++j)
        {
            const double r   = pearson_correlation(columns[i].values, columns[j].values).value_or(0.0);
            coeff[i * n + j] = r;
            coeff[j * n + i] = r;
        }
    }

    std::vector<GridCell> cells;
    cells.reserve(n * n);
    for (std::size_t i = 0; i < n; ++i)
    {
        for (std::size_t j = 0; j < n; ++j)
            cells.push_back({columns[i].name, columns[j].name, coeff[i * n + j]});
    }
    return cells;
}

}   // namespace telechart::data
