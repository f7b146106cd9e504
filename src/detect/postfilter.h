#pragma once

#include <vector>
#include <cstdint>
#include "config/config.h"
#include "detect/dbscan.h"

struct PostfilterStats {
    size_t input_clusters{0};
    size_t output_clusters{0};
    size_t removed_by_size{0};
    size_t removed_by_extent{0};
};

// Drops clusters too small to be a vehicle (radar multipath speckle) or too
// large to be one (walls, kerbs), then renumbers the survivors 0..n-1.
class Postfilter {
    PostfilterConfig config_;

public:
    explicit Postfilter(const PostfilterConfig& config = PostfilterConfig{}) : config_(config) {}

    struct FilterResult {
        std::vector<Cluster> clusters;
        PostfilterStats stats;
        std::vector<int> remap;   // input position -> new id, -1 when removed
    };

    FilterResult apply(const std::vector<Cluster>& clusters) const;

    void setConfig(const PostfilterConfig& config) { config_ = config; }
    const PostfilterConfig& getConfig() const { return config_; }
};
