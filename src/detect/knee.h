#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <vector>
#include "core/frame.h"

// Distance in the (x,y) plane from every point to its k-th nearest other
// point, sorted ascending. Points with a non-finite x or y are ignored; empty
// when k or fewer points remain.
std::vector<float> k_distances(std::span<const Point> points, int k);

// Kneedle knee detection on an ascending, convex curve y[0..n).
// Returns the index of the knee, or nullopt when the curve is too short,
// flat, linear or concave. sensitivity is the Kneedle S parameter.
std::optional<size_t> find_knee(std::span<const float> sorted, float sensitivity = 1.0f);
