#pragma once

#include "shoreline/config/configuration.hpp"
#include <map>
#include <string>

namespace shoreline::io {

// Annual climate index values keyed by year. Years with no valid month
// are absent.
struct ClimateSeries {
    std::string name;
    std::map<int, double> values;

    double at_or_nan(int year) const;
};

// Monthly table in the NOAA PSL layout: one header line, then rows of
// `year m1 .. m12`, then footer_lines trailing lines. Values equal to
// nodata are missing. Returns annual means of the valid months.
ClimateSeries parse_climate_table(const std::string& text, const std::string& name,
                                  double nodata, int footer_lines);

ClimateSeries clip_years(const ClimateSeries& series, int first_year, int last_year);

// Removes the least-squares linear trend against year
ClimateSeries detrend_series(const ClimateSeries& series);

// Reads, clips to [first_year, last_year] and optionally detrends
ClimateSeries load_climate_index(const config::ClimateIndexConfig& cfg,
                                 int first_year, int last_year);

} // namespace shoreline::io
