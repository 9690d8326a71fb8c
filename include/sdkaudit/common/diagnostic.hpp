#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sdkaudit {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kHostError,  // I/O, malformed external input
  kNote,       // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;
  // File or setting the message is about, when known
  std::optional<std::string> origin;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: host error without origin
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .message = std::move(msg),
             .origin = std::nullopt},
        .notes = {},
    };
  }

  // Factory: host error attributed to a file or setting
  static auto HostError(std::string origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .message = std::move(msg),
             .origin = std::move(origin)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
            .origin = std::nullopt,
        });
    return std::move(*this);
  }

  // "origin: message", or just the message
  [[nodiscard]] auto Describe() const -> std::string {
    if (primary.origin) {
      return *primary.origin + ": " + primary.message;
    }
    return primary.message;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace sdkaudit
