#pragma once

#include <telechart/methods.hpp>
#include <telechart/sample.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace telechart::data
{

// Applies `reducer` to the finite entries of `values` (Count counts them).
// Empty input reduces to 0.
double reduce(std::span<const double> values, Reducer reducer);

/// Buckets a series into contiguous windows of `window_ms`, starting at
/// floor(first.time).  Every non-empty window yields one sample at its
/// midpoint whose value is the reduction of the samples inside it and whose
/// category is the most common one (ties go to the first seen).  Metadata
/// holds `count`, `window_start` and `window_end`.  Empty windows are skipped.
/// Throws std::invalid_argument when window_ms is not positive or is too
/// small to separate neighbouring timestamps at the series' magnitude.
[[nodiscard]] Series aggregate_by_window(std::span<const Sample> series,
                                         double                  window_ms,
                                         Reducer                 reducer = Reducer::Mean);

// ─── Histogram ──────────────────────────────────────────────────────────────

struct Bin
{
    double      x0    = 0.0;
    double      x1    = 0.0;
    std::size_t count = 0;
};

/// Equal-width histogram over `domain` (or the finite extent of `values`).
/// Values outside the domain are ignored; the last bin is closed on the
/// right.  A zero-width extent produces a single bin holding every value.
[[nodiscard]] std::vector<Bin> bin_values(std::span<const double>                  values,
                                          std::size_t                              bin_count,
                                          std::optional<std::pair<double, double>> domain = std::nullopt);

// ─── Pivot ──────────────────────────────────────────────────────────────────

struct PivotRecord
{
    std::string row;
    std::string column;
    double      value = 0.0;
};

// A cell of a 2-D grid: x is the column key, y the row key.
struct GridCell
{
    std::string x;
    std::string y;
    double      value = 0.0;
};

/// Groups records by (row, column) and reduces each group.  Cells appear in
/// order of first occurrence.
[[nodiscard]] std::vector<GridCell> pivot(std::span<const PivotRecord> records,
                                          Reducer                      reducer = Reducer::Sum);

// ─── Correlation ────────────────────────────────────────────────────────────

struct NamedColumn
{
    std::string         name;
    std::vector<double> values;   // NaN marks a missing entry
};

/// Pairwise Pearson correlation of every column against every other,
/// row-major over `columns`.  The diagonal is 1, the matrix is symmetric and
/// pairs without a defined coefficient are 0.
[[nodiscard]] std::vector<GridCell> correlation_matrix(std::span<const NamedColumn> columns);

}   // namespace telechart::data
