#include "dbscan.h"
#include "knee.h"
#include "config/config.h"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <queue>
#include <limits>
#include <iostream>
#ifdef DBSCAN_PROFILE
#include <chrono>
#endif

DBSCAN2D::DBSCAN2D(const ClusteringConfig& cfg)
    : default_eps_(cfg.default_eps), minPts_(cfg.minPts), k_(cfg.k),
      eps_min_(cfg.eps_min), eps_max_(cfg.eps_max), sensitivity_(cfg.knee_sensitivity) {}

// Hash function for grid cell coordinates
struct CellHash {
    std::size_t operator()(const std::pair<int, int>& cell) const {
        return std::hash<int>()(cell.first) ^ (std::hash<int>()(cell.second) << 1);
    }
};

float DBSCAN2D::selectEps(std::span<const Point> points, bool* from_knee) const {
    if (from_knee) *from_knee = false;

    const auto kd = k_distances(points, k_);
    if (kd.empty()) return default_eps_;

    const auto knee = find_knee(kd, sensitivity_);
    if (!knee) return default_eps_;

    if (from_knee) *from_knee = true;
    return std::clamp(kd[*knee], eps_min_, eps_max_);
}

ClusterSet DBSCAN2D::run(std::span<const Point> points) const {
    ClusterSet out;
    out.labels.assign(points.size(), -1);
    out.eps = default_eps_;

    if (static_cast<int>(points.size()) < minPts_) {
        out.degenerate = true;
        return out;
    }

    bool from_knee = false;
    const float eps = selectEps(points, &from_knee);
    out = runWithEps(points, eps);
    out.eps_from_knee = from_knee;
    return out;
}

ClusterSet DBSCAN2D::runWithEps(std::span<const Point> points, float eps) const {
#ifdef DBSCAN_PROFILE
    auto start_time = std::chrono::high_resolution_clock::now();
#endif

    ClusterSet out;
    out.eps = eps;
    const size_t N = points.size();
    out.labels.assign(N, -1);
    if (N == 0 || static_cast<int>(N) < minPts_ || !(eps > 0.0f)) {
        out.degenerate = static_cast<int>(N) < minPts_;
        return out;
    }

    // Radius compared on squared distances; the small slack keeps a point
    // whose distance is exactly the knee-derived eps inside the neighbourhood.
    const float eps_sq = eps * eps * (1.0f + 1e-5f);

    // Spatial grid with cell size eps: neighbours lie in the 3x3 block.
    const float h = eps;
    std::unordered_map<std::pair<int, int>, std::vector<size_t>, CellHash> grid;
    grid.reserve(std::max(static_cast<size_t>(N / 3), static_cast<size_t>(16)));

    auto cellOf = [&](size_t i) {
        return std::make_pair(static_cast<int>(std::floor(points[i].x / h)),
                              static_cast<int>(std::floor(points[i].y / h)));
    };
    // Non-finite points, and points too far out for an int cell index, stay
    // out of the grid and are labelled noise.
    constexpr double kMaxCell = 1 << 30;
    std::vector<bool> usable(N, false);
    for (size_t i = 0; i < N; ++i) {
        const double gx = std::floor(static_cast<double>(points[i].x) / h);
        const double gy = std::floor(static_cast<double>(points[i].y) / h);
        if (!std::isfinite(gx) || !std::isfinite(gy) ||
            std::fabs(gx) >= kMaxCell || std::fabs(gy) >= kMaxCell) continue;
        usable[i] = true;
        grid[cellOf(i)].push_back(i);
    }

    // -1 = unvisited, -2 = noise, >=0 = cluster
    std::vector<int> cluster_id(N, -1);
    std::vector<bool> visited(N, false);
    int current_cluster = 0;

    std::vector<size_t> neighbors;
    neighbors.reserve(N);

    // Fills neighbors in ascending index order so expansion is deterministic.
    auto findNeighbors = [&](size_t point_idx) -> size_t {
        neighbors.clear();
        const float px = points[point_idx].x;
        const float py = points[point_idx].y;
        const auto [ix, iy] = cellOf(point_idx);

        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                auto it = grid.find({ix + dx, iy + dy});
                if (it == grid.end()) continue;

                for (size_t j : it->second) {
                    const float ddx = px - points[j].x;
                    const float ddy = py - points[j].y;
                    if (ddx * ddx + ddy * ddy <= eps_sq) {
                        neighbors.push_back(j); // includes point_idx itself
                    }
                }
            }
        }
        std::sort(neighbors.begin(), neighbors.end());
        return neighbors.size();
    };

    // Main DBSCAN loop
    for (size_t i = 0; i < N; ++i) {
        if (visited[i] || !usable[i]) continue;
        visited[i] = true;

        size_t neighbor_count = findNeighbors(i);

        if (static_cast<int>(neighbor_count) < minPts_) {
            cluster_id[i] = -2; // Noise for now; may become a border point
            continue;
        }

        cluster_id[i] = current_cluster;

        std::queue<size_t> seed_set;
        for (size_t neighbor : neighbors) {
            if (neighbor != i) seed_set.push(neighbor);
        }

        while (!seed_set.empty()) {
            size_t q = seed_set.front();
            seed_set.pop();

            // Border points keep the first cluster that reached them.
            if (cluster_id[q] < 0) {
                cluster_id[q] = current_cluster;
            }

            if (visited[q]) continue;
            visited[q] = true;

            size_t q_neighbor_count = findNeighbors(q);
            if (static_cast<int>(q_neighbor_count) >= minPts_) {
                for (size_t qn : neighbors) {
                    if (cluster_id[qn] < 0 || !visited[qn]) seed_set.push(qn);
                }
            }
        }

        current_cluster++;
    }

    // Cluster output
    out.clusters.resize(current_cluster);
    for (int c = 0; c < current_cluster; ++c) {
        out.clusters[c] = {
            static_cast<uint32_t>(c), {}, 0.0f, 0.0f,
            std::numeric_limits<float>::max(), std::numeric_limits<float>::max(),
            std::numeric_limits<float>::lowest(), std::numeric_limits<float>::lowest(),
            0.0f, 0.0f
        };
    }

    for (size_t i = 0; i < N; ++i) {
        const int cid = cluster_id[i];
        if (cid < 0) continue; // noise
        out.labels[i] = cid;

        auto& cluster = out.clusters[cid];
        const auto& p = points[i];
        cluster.members.push_back(p);

        cluster.minx = std::min(cluster.minx, p.x);
        cluster.miny = std::min(cluster.miny, p.y);
        cluster.maxx = std::max(cluster.maxx, p.x);
        cluster.maxy = std::max(cluster.maxy, p.y);

        // accumulate, averaged below
        cluster.cx += p.x;
        cluster.cy += p.y;
        cluster.mean_z += p.z;
        cluster.mean_doppler += p.doppler;
    }

    for (auto& cluster : out.clusters) {
        const float n = static_cast<float>(cluster.members.size());
        if (n > 0) {
            cluster.cx /= n;
            cluster.cy /= n;
            cluster.mean_z /= n;
            cluster.mean_doppler /= n;
        }
    }

#ifdef DBSCAN_PROFILE
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    std::cout << "[DBSCAN] N=" << N << " eps=" << eps << " clusters=" << current_cluster
              << " time=" << duration.count() << "us" << std::endl;
#endif

    return out;
}
