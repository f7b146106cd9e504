#include "postfilter.h"
#include <cmath>

Postfilter::FilterResult Postfilter::apply(const std::vector<Cluster>& clusters) const {
    FilterResult result;
    result.stats.input_clusters = clusters.size();

    result.remap.resize(clusters.size());
    for (size_t i = 0; i < clusters.size(); ++i) result.remap[i] = static_cast<int>(i);

    if (!config_.enabled) {
        result.clusters = clusters;
        result.stats.output_clusters = clusters.size();
        return result;
    }

    result.clusters.reserve(clusters.size());
    for (size_t i = 0; i < clusters.size(); ++i) {
        const auto& c = clusters[i];
        if (config_.min_points > 0 && static_cast<int>(c.count()) < config_.min_points) {
            result.stats.removed_by_size++;
            result.remap[i] = -1;
            continue;
        }
        if (config_.max_extent_m > 0.0f &&
            std::hypot(c.maxx - c.minx, c.maxy - c.miny) > config_.max_extent_m) {
            result.stats.removed_by_extent++;
            result.remap[i] = -1;
            continue;
        }
        result.clusters.push_back(c);
        result.clusters.back().id = static_cast<uint32_t>(result.clusters.size() - 1);
        result.remap[i] = static_cast<int>(result.clusters.back().id);
    }

    result.stats.output_clusters = result.clusters.size();
    return result;
}
