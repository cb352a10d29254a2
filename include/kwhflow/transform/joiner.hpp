#pragma once

#include "kwhflow/core/usage_types.hpp"

#include <vector>

namespace kwhflow::transform {

/**
 * @brief Inner-joins power and energy readings on exact instant equality.
 *
 * Readings present in only one series are left out, so every row carries
 * both metrics for the same instant. Output is ascending by timestamp.
 */
core::UsageTable joinPowerEnergy(std::vector<core::ResolvedReading> power,
                                 std::vector<core::ResolvedReading> energy);

} // namespace kwhflow::transform
