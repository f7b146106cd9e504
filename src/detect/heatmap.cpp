#include "heatmap.h"
#include <algorithm>
#include <cmath>

OccupancyHeatmap::OccupancyHeatmap(const HeatmapConfig& cfg, float bay_width)
  : cfg_(cfg), bay_width_(bay_width) {
  resize(x_extent_, y_extent_);
}

void OccupancyHeatmap::resize(float x_extent, float y_extent) {
  x_extent_ = x_extent;
  y_extent_ = y_extent;
  cols_ = std::max(1, static_cast<int>(std::ceil(x_extent / cfg_.cell_size)));
  rows_ = std::max(1, static_cast<int>(std::ceil(y_extent / cfg_.cell_size)));
  reset();
}

void OccupancyHeatmap::reset() {
  data_.assign(static_cast<size_t>(cols_) * rows_, 0.0f);
  hits_.assign(data_.size(), 0.0f);
  max_ = 0.0f;
  iterations_ = 0;
}

std::optional<std::pair<int, int>> OccupancyHeatmap::cellOf(float x, float y) const {
  if (!std::isfinite(x) || !std::isfinite(y)) return std::nullopt;
  const float fx = std::floor((x + x_extent_ * 0.5f) / cfg_.cell_size);
  const float fy = std::floor(y / cfg_.cell_size);
  if (fx < 0.0f || fy < 0.0f || fx >= static_cast<float>(cols_) || fy >= static_cast<float>(rows_)) {
    return std::nullopt;
  }
  return std::make_pair(static_cast<int>(fx), static_cast<int>(fy));
}

void OccupancyHeatmap::update(std::vector<Target>& targets) {
  // A cell holding two targets is stamped once.
  std::vector<std::pair<int, int>> stamped;
  for (const auto& t : targets) {
    if (t.missed > 0) continue;
    const auto cell = cellOf(t.x(), t.y());
    if (!cell || std::find(stamped.begin(), stamped.end(), *cell) != stamped.end()) continue;
    stamped.push_back(*cell);

    for (int dy = -2; dy <= 2; ++dy) {
      for (int dx = -2; dx <= 2; ++dx) {
        const int nx = cell->first + dx;
        const int ny = cell->second + dy;
        if (nx < 0 || ny < 0 || nx >= cols_ || ny >= rows_) continue;
        const int ring = std::max(std::abs(dx), std::abs(dy));
        float& v = data_[index(nx, ny)];
        v += ring == 0 ? 1.0f : (ring == 1 ? 0.75f : 0.5f);
        max_ = std::max(max_, v);
        if (ring == 0) hits_[index(nx, ny)] += 1.0f;
      }
    }
  }

  for (auto& t : targets) {
    if (t.missed > 0) continue;
    t.parked = heat(t.x(), t.y()) > cfg_.activity_threshold;
  }
  ++iterations_;
}

float OccupancyHeatmap::heat(float x, float y) const {
  const auto cell = cellOf(x, y);
  if (!cell) return 0.0f;
  return data_[index(cell->first, cell->second)] / (max_ + 1.0f);
}

HeatmapSummary OccupancyHeatmap::summary() const {
  HeatmapSummary out;
  out.frames = iterations_;
  if (iterations_ == 0) return out;

  struct Group {
    float cx, cy;                // cell coordinates
    uint32_t n;
    float score;
  };
  std::vector<Group> groups;

  // Row-major scan; a hot cell joins the first group whose running centroid
  // is within spot_radius_cells.
  for (int cy = 0; cy < rows_; ++cy) {
    for (int cx = 0; cx < cols_; ++cx) {
      const float h = hits_[index(cx, cy)];
      if (h / (max_ + 1.0f) < cfg_.activity_threshold || h <= 0.0f) continue;
      bool joined = false;
      for (auto& g : groups) {
        const float dx = static_cast<float>(cx) - g.cx;
        const float dy = static_cast<float>(cy) - g.cy;
        if (std::sqrt(dx * dx + dy * dy) < cfg_.spot_radius_cells) {
          g.cx = (g.cx * g.n + cx) / (g.n + 1);
          g.cy = (g.cy * g.n + cy) / (g.n + 1);
          ++g.n;
          g.score += h;
          joined = true;
          break;
        }
      }
      if (!joined) groups.push_back({static_cast<float>(cx), static_cast<float>(cy), 1, h});
    }
  }
  if (groups.empty()) return out;

  std::sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
    return a.cx != b.cx ? a.cx < b.cx : a.cy < b.cy;
  });

  const auto to_x = [this](float cx) { return (cx + 0.5f) * cfg_.cell_size - x_extent_ * 0.5f; };
  const auto to_y = [this](float cy) { return (cy + 0.5f) * cfg_.cell_size; };
  const float frames = static_cast<float>(iterations_);

  float sum_cy = 0.0f;
  for (const auto& g : groups) {
    out.spots.push_back({to_x(g.cx), to_y(g.cy), std::min(1.0f, g.score / frames), g.n});
    sum_cy += g.cy;
  }

  // Bays sit side by side, one bay width apart along x, all at the mean depth.
  const float pitch = std::max(1.0f, std::round(bay_width_ / cfg_.cell_size));
  const float anchor = groups.front().cx;
  const float bay_y = to_y(sum_cy / static_cast<float>(groups.size()));
  for (size_t i = 0; i < groups.size(); ++i) {
    const float snapped = anchor + std::round((groups[i].cx - anchor) / pitch) * pitch;
    out.bays.push_back({to_x(snapped), bay_y, out.spots[i].occupancy});
  }
  return out;
}
