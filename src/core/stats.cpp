#include "shoreline/core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace shoreline::core {

namespace {

constexpr int kMaxBetaIterations = 300;
constexpr double kBetaEpsilon = 3.0e-16;
constexpr double kTiny = 1.0e-300;

// Continued fraction for the incomplete beta function (modified Lentz).
double beta_continued_fraction(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::fabs(d) < kTiny) d = kTiny;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= kMaxBetaIterations; ++m) {
        const int m2 = 2 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::fabs(d) < kTiny) d = kTiny;
        c = 1.0 + aa / c;
        if (std::fabs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::fabs(d) < kTiny) d = kTiny;
        c = 1.0 + aa / c;
        if (std::fabs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::fabs(del - 1.0) < kBetaEpsilon) break;
    }
    return h;
}

} // namespace

double median_of(std::vector<double>& v) {
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if ((n % 2) == 1) return hi;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid - 1), v.end());
    const double lo = v[mid - 1];
    return 0.5 * (lo + hi);
}

double round_to(double value, int decimals) {
    if (!std::isfinite(value)) return value;
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double incomplete_beta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                             a * std::log(x) + b * std::log1p(-x);
    const double front = std::exp(log_front);

    // Use the symmetry relation where the continued fraction converges faster
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
}

double students_t_two_sided_p(double t, double df) {
    if (std::isnan(t) || !(df > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    if (std::isinf(t)) return 0.0;
    const double x = df / (df + t * t);
    return std::min(1.0, incomplete_beta(0.5 * df, 0.5, x));
}

LinearFit linregress(const std::vector<double>& x, const std::vector<double>& y) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    LinearFit fit{nan, nan, nan, nan, nan};
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return fit;

    double xmean = 0.0;
    double ymean = 0.0;
    for (size_t i = 0; i < n; ++i) {
        xmean += x[i];
        ymean += y[i];
    }
    xmean /= static_cast<double>(n);
    ymean /= static_cast<double>(n);

    double ssxm = 0.0;
    double ssym = 0.0;
    double ssxym = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - xmean;
        const double dy = y[i] - ymean;
        ssxm += dx * dx;
        ssym += dy * dy;
        ssxym += dx * dy;
    }
    if (ssxm == 0.0) return fit;

    const double r_den = std::sqrt(ssxm * ssym);
    double r = r_den == 0.0 ? 0.0 : ssxym / r_den;
    r = std::max(-1.0, std::min(1.0, r));

    fit.slope = ssxym / ssxm;
    fit.intercept = ymean - fit.slope * xmean;
    fit.rvalue = r;

    if (n == 2) {
        fit.pvalue = (y[0] == y[1]) ? 1.0 : 0.0;
        fit.standard_error = 0.0;
        return fit;
    }

    const double df = static_cast<double>(n) - 2.0;
    const double tiny = 1.0e-20;
    const double t = r * std::sqrt(df / ((1.0 - r + tiny) * (1.0 + r + tiny)));
    fit.pvalue = students_t_two_sided_p(t, df);
    fit.standard_error = std::sqrt((1.0 - r * r) * ssym / ssxm / df);
    return fit;
}

} // namespace shoreline::core
