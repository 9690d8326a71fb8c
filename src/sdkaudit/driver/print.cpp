#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "sdkaudit/common/diagnostic.hpp"

namespace sdkaudit::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  std::string location = item.origin ? *item.origin : std::string("sdkaudit");
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(location, kToolStyle),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("sdkaudit", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("sdkaudit", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

}  // namespace sdkaudit::driver
