#include "shoreline/analysis/regression.hpp"
#include "shoreline/core/parallel.hpp"
#include "shoreline/core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>

namespace shoreline::analysis {

namespace {

constexpr double kZScoreScale = 0.6745;

std::vector<double> row_values(const MovementTable& t, size_t row) {
    std::vector<double> out(t.years.size());
    for (size_t k = 0; k < t.years.size(); ++k) {
        out[k] = t.distances(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(k));
    }
    return out;
}

} // namespace

std::vector<bool> outlier_mad(const Matrix2Dd& points, double threshold) {
    const Eigen::Index n = points.rows();
    std::vector<bool> out(static_cast<size_t>(n), false);
    if (n == 0) return out;

    Eigen::RowVectorXd median(points.cols());
    for (Eigen::Index c = 0; c < points.cols(); ++c) {
        std::vector<double> col;
        col.reserve(static_cast<size_t>(n));
        for (Eigen::Index r = 0; r < n; ++r) col.push_back(points(r, c));
        median(c) = core::median_of(col);
    }

    std::vector<double> diff(static_cast<size_t>(n));
    for (Eigen::Index r = 0; r < n; ++r) {
        diff[static_cast<size_t>(r)] = (points.row(r) - median).norm();
    }
    std::vector<double> scratch = diff;
    const double mad = core::median_of(scratch);

    for (size_t i = 0; i < diff.size(); ++i) {
        if (mad == 0.0) {
            out[i] = diff[i] > 0.0;
        } else {
            out[i] = kZScoreScale * diff[i] / mad > threshold;
        }
    }
    return out;
}

std::vector<bool> outlier_mad(const std::vector<double>& values, double threshold) {
    Matrix2Dd points(static_cast<Eigen::Index>(values.size()), 1);
    for (size_t i = 0; i < values.size(); ++i) {
        points(static_cast<Eigen::Index>(i), 0) = values[i];
    }
    return outlier_mad(points, threshold);
}

RegressionResult change_regress(const std::vector<double>& x, const std::vector<double>& y,
                                const std::vector<int>& labels, double threshold, int decimals,
                                const std::optional<Detrend>& detrend) {
    const size_t n = std::min({x.size(), y.size(), labels.size()});

    std::vector<double> vx;
    std::vector<double> vy;
    std::vector<int> vlabels;
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(x[i]) || std::isnan(y[i])) continue;
        double yi = y[i];
        if (detrend) {
            yi -= detrend->slope * labels[i] + detrend->intercept;
        }
        vx.push_back(x[i]);
        vy.push_back(yi);
        vlabels.push_back(labels[i]);
    }

    Matrix2Dd xy(static_cast<Eigen::Index>(vx.size()), 2);
    for (size_t i = 0; i < vx.size(); ++i) {
        xy(static_cast<Eigen::Index>(i), 0) = vx[i];
        xy(static_cast<Eigen::Index>(i), 1) = vy[i];
    }
    const std::vector<bool> outlier = outlier_mad(xy, threshold);

    std::vector<double> fx;
    std::vector<double> fy;
    std::set<int> kept;
    for (size_t i = 0; i < vx.size(); ++i) {
        if (outlier[i]) continue;
        fx.push_back(vx[i]);
        fy.push_back(vy[i]);
        kept.insert(vlabels[i]);
    }

    std::set<int> excluded;
    for (size_t i = 0; i < n; ++i) {
        if (!kept.count(labels[i])) excluded.insert(labels[i]);
    }
    std::ostringstream ss;
    for (auto it = excluded.begin(); it != excluded.end(); ++it) {
        if (it != excluded.begin()) ss << ' ';
        ss << *it;
    }

    const core::LinearFit fit = core::linregress(fx, fy);
    RegressionResult r;
    r.slope = core::round_to(fit.slope, decimals);
    r.intercept = core::round_to(fit.intercept, decimals);
    r.pvalue = core::round_to(fit.pvalue, decimals);
    r.standard_error = core::round_to(fit.standard_error, decimals);
    r.outliers = ss.str();
    return r;
}

RateTable calculate_regressions(const MovementTable& movements,
                                const std::vector<io::ClimateSeries>& climate,
                                const config::RegressionConfig& cfg, int workers) {
    const size_t n_points = movements.points.size();
    const std::vector<int>& years = movements.years;
    std::vector<double> year_x(years.begin(), years.end());

    RateTable table;
    table.time.resize(n_points);
    const int n_workers = core::resolve_worker_count(workers, n_points);

    core::parallel_for(n_points, n_workers, [&](int, size_t i) {
        table.time[i] = change_regress(year_x, row_values(movements, i), years,
                                       cfg.mad_threshold, cfg.decimals);
    });

    for (const auto& series : climate) {
        std::vector<double> cx;
        cx.reserve(years.size());
        for (int year : years) cx.push_back(series.at_or_nan(year));

        ClimateRegression cr;
        cr.name = series.name;
        cr.results.resize(n_points);
        core::parallel_for(n_points, n_workers, [&](int, size_t i) {
            const RegressionResult& t = table.time[i];
            std::optional<Detrend> detrend;
            if (!std::isnan(t.slope) && !std::isnan(t.intercept)) {
                detrend = Detrend{t.slope, t.intercept};
            }
            cr.results[i] = change_regress(cx, row_values(movements, i), years,
                                           cfg.mad_threshold, cfg.decimals, detrend);
        });
        table.climate.push_back(std::move(cr));
    }
    return table;
}

} // namespace shoreline::analysis
