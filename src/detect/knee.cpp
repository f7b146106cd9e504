#include "knee.h"
#include <algorithm>
#include <cmath>

std::vector<float> k_distances(std::span<const Point> points, int k) {
    // Non-finite coordinates have no distance; they are left out.
    std::vector<const Point*> pts;
    pts.reserve(points.size());
    for (const auto& p : points) {
        if (std::isfinite(p.x) && std::isfinite(p.y)) pts.push_back(&p);
    }
    const size_t N = pts.size();
    if (k < 1 || N <= static_cast<size_t>(k)) return {};

    std::vector<float> out(N);
    std::vector<float> d2;
    d2.reserve(N - 1);

    for (size_t i = 0; i < N; ++i) {
        d2.clear();
        for (size_t j = 0; j < N; ++j) {
            if (j == i) continue;
            const float dx = pts[i]->x - pts[j]->x;
            const float dy = pts[i]->y - pts[j]->y;
            d2.push_back(dx * dx + dy * dy);
        }
        std::nth_element(d2.begin(), d2.begin() + (k - 1), d2.end());
        out[i] = std::sqrt(d2[k - 1]);
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::optional<size_t> find_knee(std::span<const float> y, float sensitivity) {
    const size_t n = y.size();
    if (n < 3) return std::nullopt;

    const float y_min = y.front();
    const float y_max = y.back();
    const double range = static_cast<double>(y_max) - static_cast<double>(y_min);
    if (!(range > 1e-9) || !std::isfinite(range)) return std::nullopt;  // flat, unsorted or overflowed

    // Difference curve between the diagonal and the normalized curve.
    // A convex increasing curve sits below the diagonal, so its knee is a
    // local maximum of d.
    const double dx = 1.0 / static_cast<double>(n - 1);
    std::vector<double> d(n);
    for (size_t i = 0; i < n; ++i) {
        const double xn = static_cast<double>(i) * dx;
        const double yn = (static_cast<double>(y[i]) - y_min) / range;
        d[i] = xn - yn;
    }

    std::optional<size_t> candidate;
    double threshold = 0.0;
    for (size_t i = 1; i < n; ++i) {
        const bool local_max = i + 1 < n && d[i] > d[i - 1] && d[i] >= d[i + 1];
        if (local_max && d[i] > 0.0) {
            candidate = i;
            threshold = d[i] - sensitivity * dx;
            continue;
        }
        if (candidate && d[i] < threshold) {
            return candidate;
        }
    }
    return std::nullopt;
}
