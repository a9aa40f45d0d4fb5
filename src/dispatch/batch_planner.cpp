#include "teledrop/dispatch/batch_planner.hpp"

#include <algorithm>

namespace teledrop::dispatch {

common::Result<std::vector<FileGroup>> plan_file_groups(const std::vector<FileRef> &files,
                                                        const std::size_t max_group_size) {
  using Groups = std::vector<FileGroup>;
  if (max_group_size == 0) {
    return common::Result<Groups>::failure(common::ErrorKind::Configuration,
                                           "max group size must be at least 1");
  }

  Groups groups;
  const std::size_t total = (files.size() + max_group_size - 1) / max_group_size;
  groups.reserve(total);
  for (std::size_t begin = 0; begin < files.size(); begin += max_group_size) {
    const std::size_t end = std::min(files.size(), begin + max_group_size);
    FileGroup group;
    group.items.assign(files.begin() + static_cast<std::ptrdiff_t>(begin),
                       files.begin() + static_cast<std::ptrdiff_t>(end));
    group.index = groups.size() + 1;
    group.total = total;
    groups.push_back(std::move(group));
  }
  return common::Result<Groups>::success(std::move(groups));
}

} // namespace teledrop::dispatch
