#include "sdkaudit/common/markup.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace sdkaudit::common {

namespace {

constexpr std::string_view kOpenPrefix = "<color=";
constexpr std::string_view kClose = "</color>";

auto ParseHexColor(std::string_view hex) -> std::optional<uint32_t> {
  if (hex.size() != 6) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (char c : hex) {
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

auto StyleForColor(std::string_view color) -> fmt::text_style {
  if (color.starts_with('#')) {
    if (auto rgb = ParseHexColor(color.substr(1))) {
      return fmt::fg(fmt::rgb(*rgb)) | fmt::emphasis::bold;
    }
    return {};
  }
  if (color == "red") {
    return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
  if (color == "green") {
    return fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
  }
  if (color == "yellow") {
    return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
  }
  if (color == "blue") {
    return fmt::fg(fmt::terminal_color::bright_blue) | fmt::emphasis::bold;
  }
  if (color == "magenta") {
    return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
  }
  if (color == "cyan") {
    return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  if (color == "white") {
    return fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;
  }
  if (color == "black") {
    return fmt::fg(fmt::terminal_color::black);
  }
  if (color == "grey" || color == "gray") {
    return fmt::fg(fmt::terminal_color::bright_black);
  }
  return {};
}

}  // namespace

auto ParseMarkupMode(std::string_view name) -> std::optional<MarkupMode> {
  if (name == "ansi") {
    return MarkupMode::kAnsi;
  }
  if (name == "plain") {
    return MarkupMode::kPlain;
  }
  if (name == "raw") {
    return MarkupMode::kRaw;
  }
  return std::nullopt;
}

auto RenderMarkup(std::string_view text, MarkupMode mode) -> std::string {
  if (mode == MarkupMode::kRaw) {
    return std::string(text);
  }

  std::string out;
  std::vector<fmt::text_style> styles;
  std::string pending;

  auto flush = [&] {
    if (pending.empty()) {
      return;
    }
    if (mode == MarkupMode::kAnsi && !styles.empty()) {
      out += fmt::format("{}", fmt::styled(pending, styles.back()));
    } else {
      out += pending;
    }
    pending.clear();
  };

  size_t pos = 0;
  while (pos < text.size()) {
    std::string_view rest = text.substr(pos);
    if (rest.starts_with(kOpenPrefix)) {
      size_t end = rest.find('>');
      if (end != std::string_view::npos) {
        flush();
        auto color = rest.substr(kOpenPrefix.size(), end - kOpenPrefix.size());
        styles.push_back(StyleForColor(color));
        pos += end + 1;
        continue;
      }
    }
    if (rest.starts_with(kClose)) {
      flush();
      if (!styles.empty()) {
        styles.pop_back();
      }
      pos += kClose.size();
      continue;
    }
    pending += text[pos];
    ++pos;
  }
  flush();
  return out;
}

}  // namespace sdkaudit::common
