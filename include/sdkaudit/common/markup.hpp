#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sdkaudit::common {

// How <color=...>...</color> spans in diagnostic text are rendered.
enum class MarkupMode : uint8_t {
  kAnsi,   // Terminal escape sequences
  kPlain,  // Tags stripped
  kRaw,    // Tags kept verbatim
};

auto ParseMarkupMode(std::string_view name) -> std::optional<MarkupMode>;

// Accepted colors: #RRGGBB and the names black, red, green, yellow, blue,
// magenta, cyan, white, grey/gray. Unknown colors render unstyled. Tags
// may nest; a stray closing tag is dropped.
auto RenderMarkup(std::string_view text, MarkupMode mode) -> std::string;

}  // namespace sdkaudit::common
