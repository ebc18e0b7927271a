#pragma once

#include <optional>
#include <string>
#include <vector>

namespace shoreline::analysis {

struct SummaryStats {
    int valid_obs = 0;
    int valid_span = 0;
    double sce = 0.0;
    double nsm = 0.0;
    std::optional<int> max_year;
    std::optional<int> min_year;
};

// Space separated year list as written in outlier attributes
std::vector<int> parse_year_list(const std::string& s);

// Statistics over the years at or after initial_year that have a distance
// and are not listed in `outliers`. Years must be ascending. No valid
// year gives zero counts, NaN measures and no max/min year.
SummaryStats all_time_stats(const std::vector<int>& years, const std::vector<double>& distances,
                            const std::string& outliers, int initial_year);

} // namespace shoreline::analysis
