#include <telechart/sample.hpp>

#include <algorithm>
#include <cmath>

namespace telechart
{

bool is_valid(const Sample& s)
{
    return std::isfinite(s.time) && std::isfinite(s.value);
}

Series sanitize(std::span<const Sample> series)
{
    Series out;
    out.reserve(series.size());
    for (const auto& s : series)
    {
        if (is_valid(s))
            out.push_back(s);
    }
    return out;
}

Series sorted_by_time(std::span<const Sample> series)
{
    Series out(series.begin(), series.end());
    std::stable_sort(out.begin(),
                     out.end(),
                     [](const Sample& a, const Sample& b) { return a.time < b.time; });
    return out;
}

Series prepare(std::span<const Sample> series)
{
    Series out = sanitize(series);
    std::stable_sort(out.begin(),
                     out.end(),
                     [](const Sample& a, const Sample& b) { return a.time < b.time; });
    return out;
}

bool is_sorted_by_time(std::span<const Sample> series)
{
    return std::is_sorted(series.begin(),
                          series.end(),
                          [](const Sample& a, const Sample& b) { return a.time < b.time; });
}

std::vector<double> values_of(std::span<const Sample> series)
{
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& s : series)
        out.push_back(s.value);
    return out;
}

template <typename T>
static std::optional<T> metadata_as(const Sample& s, const std::string& key)
{
    auto it = s.metadata.find(key);
    if (it == s.metadata.end())
        return std::nullopt;
    if (const T* v = std::get_if<T>(&it->second))
        return *v;
    return std::nullopt;
}

std::optional<bool> metadata_bool(const Sample& s, const std::string& key)
{
    return metadata_as<bool>(s, key);
}

std::optional<double> metadata_number(const Sample& s, const std::string& key)
{
    return metadata_as<double>(s, key);
}

std::optional<std::string> metadata_string(const Sample& s, const std::string& key)
{
    return metadata_as<std::string>(s, key);
}

}   // namespace telechart
