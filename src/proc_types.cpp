#include "proc_supervisor/proc_types.hpp"

namespace procTypes {

std::optional<LaunchSpec> parseLaunchEntry(const std::string &entry) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (fields.size() < 3) {
    const auto bar = entry.find('|', start);
    if (bar == std::string::npos) {
      return std::nullopt;
    }
    fields.push_back(entry.substr(start, bar - start));
    start = bar + 1;
  }
  const std::string command = entry.substr(start);

  const auto category = categoryFromString(fields[0]);
  if (!category || fields[1].empty() || command.empty()) {
    return std::nullopt;
  }
  return LaunchSpec::fromShellCommand(*category, fields[1], fields[2],
                                      command);
}

}  // namespace procTypes
