#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace sdkaudit::audit {

inline constexpr std::string_view kProgramFiles32 = "Program Files (x86)";
inline constexpr std::string_view kProgramFiles64 = "Program Files";
inline constexpr std::string_view kDefaultSdkFolderMarker = "dotnet\\";

// Join path components with Windows rules: a backslash is inserted between
// components unless the left side already ends in '\' or '/'. Empty
// components are skipped. Does not touch the filesystem.
auto JoinWindowsPath(std::initializer_list<std::string_view> parts)
    -> std::string;

// Candidate install locations of the SDK on one volume.
struct CandidatePaths {
  std::string path32;
  std::string path64;
};

auto CandidatesFor(std::string_view volume_root, std::string_view marker)
    -> CandidatePaths;

// Split a search path into its non-empty entries, in order.
auto SplitSearchPath(std::string_view search_path, char separator = ';')
    -> std::vector<std::string>;

}  // namespace sdkaudit::audit
