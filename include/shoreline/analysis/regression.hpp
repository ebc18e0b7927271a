#pragma once

#include "shoreline/analysis/movements.hpp"
#include "shoreline/config/configuration.hpp"
#include "shoreline/io/climate_io.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shoreline::analysis {

struct RegressionResult {
    double slope = 0.0;
    double intercept = 0.0;
    double pvalue = 0.0;
    double standard_error = 0.0;
    // Sorted labels of missing rows and MAD outliers, space separated
    std::string outliers;
};

// Linear time trend removed from the dependent values before fitting
struct Detrend {
    double slope = 0.0;
    double intercept = 0.0;
};

// Modified z-score outliers of n-dimensional observations (one row each).
// With a zero median absolute deviation every row off the median is an outlier.
std::vector<bool> outlier_mad(const Matrix2Dd& points, double threshold);
std::vector<bool> outlier_mad(const std::vector<double>& values, double threshold);

// Robust linear fit of y on x. Rows with a missing x or y are dropped, the
// detrend (evaluated at each row's label) is subtracted from y, MAD
// outliers of the (x, y) rows are excluded and ordinary least squares is
// run on the rest. Never throws: too few rows give NaN fields.
RegressionResult change_regress(const std::vector<double>& x, const std::vector<double>& y,
                                const std::vector<int>& labels, double threshold, int decimals,
                                const std::optional<Detrend>& detrend = std::nullopt);

struct ClimateRegression {
    std::string name;
    std::vector<RegressionResult> results;
};

struct RateTable {
    std::vector<RegressionResult> time;
    std::vector<ClimateRegression> climate;
};

// Time regression of every point, then each climate index against the
// point's detrended distances. Runs over points on `workers` threads.
RateTable calculate_regressions(const MovementTable& movements,
                                const std::vector<io::ClimateSeries>& climate,
                                const config::RegressionConfig& cfg, int workers);

} // namespace shoreline::analysis
