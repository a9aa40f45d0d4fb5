#pragma once

#include "teledrop/common/result.hpp"
#include "teledrop/dispatch/types.hpp"

#include <vector>

namespace teledrop::dispatch {

/// Split files into contiguous groups of at most max_group_size, preserving order.
/// Group k (1-based) holds files [(k-1)*max_group_size, k*max_group_size). An empty
/// input yields no groups. Fails with a configuration error when max_group_size is 0.
[[nodiscard]] common::Result<std::vector<FileGroup>>
plan_file_groups(const std::vector<FileRef> &files, std::size_t max_group_size);

} // namespace teledrop::dispatch
