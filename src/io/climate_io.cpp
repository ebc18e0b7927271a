#include "shoreline/io/climate_io.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/stats.hpp"
#include "shoreline/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

namespace shoreline::io {

double ClimateSeries::at_or_nan(int year) const {
    auto it = values.find(year);
    return it == values.end() ? std::numeric_limits<double>::quiet_NaN() : it->second;
}

ClimateSeries parse_climate_table(const std::string& text, const std::string& name,
                                  double nodata, int footer_lines) {
    std::vector<std::string> lines;
    {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
    }
    // Trailing blank lines are not part of the footer count
    while (!lines.empty() && core::trim(lines.back()).empty()) {
        lines.pop_back();
    }

    const long first = 1;
    const long last = static_cast<long>(lines.size()) - std::max(0, footer_lines);
    if (last <= first) {
        throw ValidationError("climate table '" + name + "' has no data rows");
    }

    ClimateSeries series;
    series.name = name;
    for (long i = first; i < last; ++i) {
        const auto tokens = core::split_whitespace(lines[static_cast<size_t>(i)]);
        if (tokens.empty()) continue;

        int year = 0;
        try {
            year = std::stoi(tokens[0]);
        } catch (const std::exception&) {
            throw ValidationError("climate table '" + name + "' line " + std::to_string(i + 1) +
                                  ": bad year '" + tokens[0] + "'");
        }

        double sum = 0.0;
        int n = 0;
        for (size_t k = 1; k < tokens.size(); ++k) {
            double v = 0.0;
            try {
                v = std::stod(tokens[k]);
            } catch (const std::exception&) {
                throw ValidationError("climate table '" + name + "' line " +
                                      std::to_string(i + 1) + ": bad value '" + tokens[k] + "'");
            }
            if (std::isnan(v) || std::fabs(v - nodata) < 1e-9) continue;
            sum += v;
            ++n;
        }
        if (n > 0) {
            series.values[year] = sum / n;
        }
    }
    return series;
}

ClimateSeries clip_years(const ClimateSeries& series, int first_year, int last_year) {
    ClimateSeries out;
    out.name = series.name;
    for (const auto& [year, v] : series.values) {
        if (year >= first_year && year <= last_year) {
            out.values[year] = v;
        }
    }
    return out;
}

ClimateSeries detrend_series(const ClimateSeries& series) {
    std::vector<double> x;
    std::vector<double> y;
    for (const auto& [year, v] : series.values) {
        x.push_back(static_cast<double>(year));
        y.push_back(v);
    }
    const core::LinearFit fit = core::linregress(x, y);
    if (std::isnan(fit.slope)) {
        return series;
    }
    ClimateSeries out = series;
    for (auto& [year, v] : out.values) {
        v -= fit.slope * year + fit.intercept;
    }
    return out;
}

ClimateSeries load_climate_index(const config::ClimateIndexConfig& cfg,
                                 int first_year, int last_year) {
    if (!fs::exists(cfg.path)) {
        throw NoDataError("climate index file not found: " + cfg.path);
    }
    ClimateSeries series = parse_climate_table(core::read_text(cfg.path), cfg.name,
                                               cfg.nodata, cfg.footer_lines);
    series = clip_years(series, first_year, last_year);
    if (cfg.detrend) {
        series = detrend_series(series);
    }
    return series;
}

} // namespace shoreline::io
