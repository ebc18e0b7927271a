#include "shoreline/contour/marching_squares.hpp"

#include <cmath>
#include <map>
#include <unordered_map>

namespace shoreline::contour {

namespace {

using EdgeKey = long long;

struct Segment {
    EdgeKey from;
    EdgeKey to;
};

double fraction(double from, double to, double level) {
    if (to == from) return 0.0;
    return (level - from) / (to - from);
}

} // namespace

std::vector<PixelPath> find_contours(const Matrix2Df& grid, double level) {
    const long rows = grid.rows();
    const long cols = grid.cols();
    std::vector<PixelPath> out;
    if (rows < 2 || cols < 2) {
        return out;
    }

    // Crossing points keyed by the grid edge they lie on. Horizontal edge
    // (r, c)-(r, c+1) is 2*(r*cols + c), vertical edge (r, c)-(r+1, c) is +1.
    std::unordered_map<EdgeKey, PixelPoint> points;
    std::vector<Segment> segments;

    for (long r = 0; r < rows - 1; ++r) {
        for (long c = 0; c < cols - 1; ++c) {
            const double ul = grid(r, c);
            const double ur = grid(r, c + 1);
            const double ll = grid(r + 1, c);
            const double lr = grid(r + 1, c + 1);
            if (std::isnan(ul) || std::isnan(ur) || std::isnan(ll) || std::isnan(lr)) {
                continue;
            }

            int square_case = 0;
            if (ul > level) square_case |= 1;
            if (ur > level) square_case |= 2;
            if (ll > level) square_case |= 4;
            if (lr > level) square_case |= 8;
            if (square_case == 0 || square_case == 15) {
                continue;
            }

            const EdgeKey top = 2 * (r * cols + c);
            const EdgeKey bottom = 2 * ((r + 1) * cols + c);
            const EdgeKey left = 2 * (r * cols + c) + 1;
            const EdgeKey right = 2 * (r * cols + c + 1) + 1;

            auto add = [&](EdgeKey a, EdgeKey b) {
                segments.push_back({a, b});
            };

            switch (square_case) {
                case 1: add(top, left); break;
                case 2: add(right, top); break;
                case 3: add(right, left); break;
                case 4: add(left, bottom); break;
                case 5: add(top, bottom); break;
                case 6: add(right, top); add(left, bottom); break;
                case 7: add(right, bottom); break;
                case 8: add(bottom, right); break;
                case 9: add(top, left); add(bottom, right); break;
                case 10: add(bottom, top); break;
                case 11: add(bottom, left); break;
                case 12: add(left, right); break;
                case 13: add(top, right); break;
                case 14: add(left, top); break;
                default: break;
            }

            points.emplace(top, PixelPoint{static_cast<double>(r), c + fraction(ul, ur, level)});
            points.emplace(bottom, PixelPoint{static_cast<double>(r + 1), c + fraction(ll, lr, level)});
            points.emplace(left, PixelPoint{r + fraction(ul, ll, level), static_cast<double>(c)});
            points.emplace(right, PixelPoint{r + fraction(ur, lr, level), static_cast<double>(c + 1)});
        }
    }

    // Every crossing has at most one outgoing and one incoming segment
    std::map<EdgeKey, EdgeKey> next;
    std::unordered_map<EdgeKey, bool> has_incoming;
    for (const auto& s : segments) {
        next[s.from] = s.to;
        has_incoming[s.to] = true;
    }

    std::unordered_map<EdgeKey, bool> visited;
    auto trace = [&](EdgeKey start) {
        PixelPath path;
        EdgeKey cur = start;
        path.push_back(points.at(cur));
        visited[cur] = true;
        while (true) {
            auto it = next.find(cur);
            if (it == next.end()) break;
            cur = it->second;
            path.push_back(points.at(cur));
            if (visited[cur]) break; // closed
            visited[cur] = true;
        }
        return path;
    };

    // Open lines start where nothing leads in
    for (const auto& kv : next) {
        if (!has_incoming[kv.first] && !visited[kv.first]) {
            out.push_back(trace(kv.first));
        }
    }
    // Remaining segments form closed rings
    for (const auto& kv : next) {
        if (!visited[kv.first]) {
            out.push_back(trace(kv.first));
        }
    }
    return out;
}

} // namespace shoreline::contour
