#pragma once

#include <vector>

namespace shoreline::core {

// Median of the values; reorders the input. NaN for an empty input.
double median_of(std::vector<double>& v);

// Round half away from zero to a fixed number of decimals; NaN passes through.
double round_to(double value, int decimals);

// Regularized incomplete beta function I_x(a, b).
double incomplete_beta(double a, double b, double x);

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double rvalue = 0.0;
    double pvalue = 0.0;
    double standard_error = 0.0;
};

// Ordinary least squares of y on x. Fields are NaN for fewer than two
// points or a constant x. Two points give a zero standard error and a
// p-value of 1 for a flat line, 0 otherwise.
LinearFit linregress(const std::vector<double>& x, const std::vector<double>& y);

// Two-sided p-value of Student's t statistic with df degrees of freedom.
double students_t_two_sided_p(double t, double df);

} // namespace shoreline::core
