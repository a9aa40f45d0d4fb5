#include "test_framework.hpp"

#include "teledrop/dispatch/batch_planner.hpp"

#include <string>

namespace {

std::vector<teledrop::dispatch::FileRef> make_files(const std::size_t count) {
  std::vector<teledrop::dispatch::FileRef> files;
  files.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    files.emplace_back("file_" + std::to_string(i) + ".bin");
  }
  return files;
}

} // namespace

void register_batch_planner_tests(std::vector<teledrop::tests::TestCase> &tests) {
  using teledrop::tests::require;
  namespace dp = teledrop::dispatch;

  tests.push_back({"batch_planner_partition_properties", [] {
                     for (std::size_t count = 1; count <= 25; ++count) {
                       for (std::size_t max = 1; max <= 11; ++max) {
                         const auto files = make_files(count);
                         auto planned = dp::plan_file_groups(files, max);
                         require(planned.ok(), planned.error());
                         const auto &groups = planned.value();
                         const std::string where =
                             " (files=" + std::to_string(count) + ", max=" + std::to_string(max) + ")";

                         std::vector<dp::FileRef> joined;
                         for (std::size_t i = 0; i < groups.size(); ++i) {
                           const auto &group = groups[i];
                           require(!group.items.empty() && group.items.size() <= max,
                                   "group size out of range" + where);
                           require(group.index == i + 1, "indexes are 1-based" + where);
                           require(group.total == groups.size(), "total mismatch" + where);
                           joined.insert(joined.end(), group.items.begin(), group.items.end());
                         }
                         require(joined == files, "groups must reproduce the input order" + where);

                         const std::size_t remainder = count % max;
                         const std::size_t expected_last = remainder == 0 ? max : remainder;
                         require(groups.back().items.size() == expected_last,
                                 "last group size mismatch" + where);
                       }
                     }
                   }});

  tests.push_back({"batch_planner_twenty_three_files_by_ten", [] {
                     auto planned = dp::plan_file_groups(make_files(23), 10);
                     require(planned.ok(), planned.error());
                     const auto &groups = planned.value();
                     require(groups.size() == 3, "expected three groups");
                     require(groups[0].items.size() == 10 && groups[1].items.size() == 10 &&
                                 groups[2].items.size() == 3,
                             "expected sizes [10, 10, 3]");
                     require(groups[2].items.front() == dp::FileRef("file_20.bin"),
                             "third group starts at the 21st file");
                   }});

  tests.push_back({"batch_planner_empty_input_gives_no_groups", [] {
                     auto planned = dp::plan_file_groups({}, 10);
                     require(planned.ok() && planned.value().empty(), "no files, no groups");
                   }});

  tests.push_back({"batch_planner_zero_group_size_is_configuration_error", [] {
                     auto planned = dp::plan_file_groups(make_files(3), 0);
                     require(!planned.ok(), "zero max group size must fail");
                     require(planned.kind() == teledrop::common::ErrorKind::Configuration,
                             "configuration error expected");
                   }});

  tests.push_back({"batch_planner_is_deterministic", [] {
                     const auto files = make_files(17);
                     auto first = dp::plan_file_groups(files, 4);
                     auto second = dp::plan_file_groups(files, 4);
                     require(first.ok() && second.ok(), "planning should succeed");
                     require(first.value() == second.value(), "identical inputs, identical plans");
                   }});
}
