#include "sdkaudit/audit/search_path.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace sdkaudit::audit {

namespace {

auto EndsWithSeparator(const std::string& path) -> bool {
  return !path.empty() && (path.back() == '\\' || path.back() == '/');
}

}  // namespace

auto JoinWindowsPath(std::initializer_list<std::string_view> parts)
    -> std::string {
  std::string result;
  for (std::string_view part : parts) {
    if (part.empty()) {
      continue;
    }
    if (!result.empty() && !EndsWithSeparator(result)) {
      result += '\\';
    }
    result += part;
  }
  return result;
}

auto CandidatesFor(std::string_view volume_root, std::string_view marker)
    -> CandidatePaths {
  return CandidatePaths{
      .path32 = JoinWindowsPath({volume_root, kProgramFiles32, marker}),
      .path64 = JoinWindowsPath({volume_root, kProgramFiles64, marker}),
  };
}

auto SplitSearchPath(std::string_view search_path, char separator)
    -> std::vector<std::string> {
  std::vector<std::string> entries;
  size_t start = 0;
  while (start <= search_path.size()) {
    size_t end = search_path.find(separator, start);
    if (end == std::string_view::npos) {
      end = search_path.size();
    }
    std::string_view entry = search_path.substr(start, end - start);
    if (!entry.empty()) {
      entries.emplace_back(entry);
    }
    start = end + 1;
  }
  return entries;
}

}  // namespace sdkaudit::audit
