#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sdkaudit::audit {

enum class MessageId : uint8_t {
  kExplanation,
  kSystemPath,  // Takes the search path as its single {} argument
  kSdk64Only,
  kSdk32Only,
  kBothCorrect,
  kBothWrongOrder,
  kNotFound,
};

inline constexpr size_t kMessageIdCount = 7;

inline constexpr std::string_view kDefaultLanguage = "en";

// Key used for a message in configuration files ("sdk64Only", ...).
auto ToKey(MessageId id) -> std::string_view;
auto ParseMessageId(std::string_view key) -> std::optional<MessageId>;

// Localized templates, one per MessageId. Immutable once handed to the
// auditor.
class MessageCatalog {
 public:
  MessageCatalog() = default;
  explicit MessageCatalog(std::array<std::string, kMessageIdCount> templates)
      : templates_(std::move(templates)) {
  }

  [[nodiscard]] auto Get(MessageId id) const -> const std::string& {
    return templates_.at(static_cast<size_t>(id));
  }

  void Set(MessageId id, std::string text) {
    templates_.at(static_cast<size_t>(id)) = std::move(text);
  }

  // The systemPath template with the search path substituted.
  [[nodiscard]] auto FormatSystemPath(std::string_view search_path) const
      -> std::string;

 private:
  std::array<std::string, kMessageIdCount> templates_;
};

auto EnglishCatalog() -> MessageCatalog;
auto FrenchCatalog() -> MessageCatalog;

// Reduce a locale or language tag to its lowercase two-letter language:
// "fr_CA.UTF-8" -> "fr", "EN-us" -> "en". Returns "" for the C and POSIX
// locales (with any codeset, e.g. "C.UTF-8") and for empty input.
auto NormalizeLanguageTag(std::string_view tag) -> std::string;

// Language tag -> catalog. Always contains the built-in "en" and "fr"
// catalogs; "en" is the fallback for unknown tags.
class CatalogRegistry {
 public:
  CatalogRegistry();

  // Adds or replaces the catalog for a tag. The tag is normalized first.
  void Add(std::string_view tag, MessageCatalog catalog);

  [[nodiscard]] auto Has(std::string_view tag) const -> bool;

  // Catalog for the tag, or the English catalog when the tag is unknown.
  [[nodiscard]] auto Resolve(std::string_view tag) const
      -> const MessageCatalog&;

  [[nodiscard]] auto Tags() const -> std::vector<std::string>;

 private:
  std::map<std::string, MessageCatalog, std::less<>> catalogs_;
};

}  // namespace sdkaudit::audit
