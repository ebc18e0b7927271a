#include "shoreline/analysis/statistics.hpp"
#include "shoreline/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace shoreline::analysis {

std::vector<int> parse_year_list(const std::string& s) {
    std::vector<int> out;
    for (const auto& token : core::split_whitespace(s)) {
        try {
            out.push_back(std::stoi(token));
        } catch (const std::exception&) {
            // Not a year label; nothing to exclude
        }
    }
    return out;
}

SummaryStats all_time_stats(const std::vector<int>& years, const std::vector<double>& distances,
                            const std::string& outliers, int initial_year) {
    const auto excluded_list = parse_year_list(outliers);
    const std::set<int> excluded(excluded_list.begin(), excluded_list.end());

    std::vector<int> vy;
    std::vector<double> vd;
    const size_t n = std::min(years.size(), distances.size());
    for (size_t i = 0; i < n; ++i) {
        if (years[i] < initial_year || excluded.count(years[i]) || std::isnan(distances[i])) {
            continue;
        }
        vy.push_back(years[i]);
        vd.push_back(distances[i]);
    }

    SummaryStats s;
    s.valid_obs = static_cast<int>(vy.size());
    if (vy.empty()) {
        s.sce = std::numeric_limits<double>::quiet_NaN();
        s.nsm = std::numeric_limits<double>::quiet_NaN();
        return s;
    }

    s.valid_span = vy.back() - vy.front() + 1;
    const auto max_it = std::max_element(vd.begin(), vd.end());
    const auto min_it = std::min_element(vd.begin(), vd.end());
    s.sce = *max_it - *min_it;
    s.nsm = vd.back() - vd.front();
    s.max_year = vy[static_cast<size_t>(max_it - vd.begin())];
    s.min_year = vy[static_cast<size_t>(min_it - vd.begin())];
    return s;
}

} // namespace shoreline::analysis
