#include "sdkaudit/audit/message_catalog.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sdkaudit/version.hpp"

namespace sdkaudit::audit {

namespace {

constexpr std::array<std::string_view, kMessageIdCount> kMessageKeys = {
    "explanation", "systemPath",     "sdk64Only", "sdk32Only",
    "bothCorrect", "bothWrongOrder", "notFound",
};

auto EnglishExplanation() -> std::string {
  return fmt::format(
      "\nsdkaudit checks that the .NET SDK required by VSCode is installed "
      "and reachable through the PATH.\n"
      "** sdkaudit {} **",
      kVersion);
}

auto FrenchExplanation() -> std::string {
  return fmt::format(
      "\nsdkaudit vérifie que le .NET SDK requis par VSCode est installé et "
      "accessible par le PATH.\n"
      "** sdkaudit {} **",
      kVersion);
}

}  // namespace

auto ToKey(MessageId id) -> std::string_view {
  return kMessageKeys.at(static_cast<size_t>(id));
}

auto ParseMessageId(std::string_view key) -> std::optional<MessageId> {
  for (size_t i = 0; i < kMessageKeys.size(); ++i) {
    if (kMessageKeys[i] == key) {
      return static_cast<MessageId>(i);
    }
  }
  return std::nullopt;
}

auto MessageCatalog::FormatSystemPath(std::string_view search_path) const
    -> std::string {
  const std::string& tmpl = Get(MessageId::kSystemPath);
  try {
    return fmt::format(fmt::runtime(tmpl), search_path);
  } catch (const fmt::format_error& e) {
    // Templates are validated when loaded; keep the path visible anyway.
    spdlog::warn("invalid systemPath template '{}': {}", tmpl, e.what());
    return tmpl + std::string(search_path);
  }
}

auto EnglishCatalog() -> MessageCatalog {
  std::array<std::string, kMessageIdCount> templates = {
      EnglishExplanation(),
      "\nCurrent system PATH where executables are searched for: {}",
      "<color=#90ee90>TEST PASSED</color> → .NET SDK (64-bit) is in the "
      "PATH. 64-bit SDK path: ",
      "<color=red>TEST FAILED</color> → .NET SDK (32-bit) is in the PATH, "
      "but not .NET SDK (64-bit). 32-bit SDK path: ",
      "<color=#90ee90>TEST PASSED</color> → .NET SDK (64-bit) is in the "
      "PATH before the 32-bit version. 64-bit SDK path: ",
      "<color=yellow>TEST PARTIALLY FAILED</color> → .NET SDK (64-bit) is in "
      "the PATH, BUT it comes after the 32-bit version (pre-2024 versions of "
      "the C# Dev Kit extension for VSCode pick the first one). 32-bit SDK "
      "path: ",
      "<color=red>TEST FAILED</color> → .NET SDK is not found in the PATH. ",
  };
  return MessageCatalog(std::move(templates));
}

auto FrenchCatalog() -> MessageCatalog {
  std::array<std::string, kMessageIdCount> templates = {
      FrenchExplanation(),
      "\nChemin d'accès système actuel où les exécutables sont recherchés : "
      "{}",
      "<color=#90ee90>TEST RÉUSSI</color> → .NET SDK (64-bit) est dans le "
      "PATH. Chemin du SDK 64-bit : ",
      "<color=red>TEST ÉCHOUÉ</color> → .NET SDK (32-bit) est dans le PATH, "
      "mais pas .NET SDK (64-bit). Chemin du SDK 32-bit : ",
      "<color=#90ee90>TEST RÉUSSI</color> → .NET SDK (64-bit) est dans le "
      "PATH avant la version 32-bit. Chemin du SDK 64-bit : ",
      "<color=yellow>TEST PARTIELLEMENT ÉCHOUÉ</color> → .NET SDK (64-bit) "
      "est dans le PATH, MAIS il est après la version 32-bit (les versions "
      "pré 2024 de l'extension C# Dev Kit pour VSCode prennent la "
      "première). Chemin du SDK 32-bit : ",
      "<color=red>TEST ÉCHOUÉ</color> → .NET SDK n'est pas trouvé dans le "
      "PATH. ",
  };
  return MessageCatalog(std::move(templates));
}

auto NormalizeLanguageTag(std::string_view tag) -> std::string {
  // "C.UTF-8", "POSIX@euro": codeset and modifier do not change the language
  std::string_view base = tag.substr(0, tag.find_first_of(".@"));
  if (base == "C" || base == "POSIX") {
    return {};
  }
  std::string language;
  for (char c : tag) {
    if (std::isalpha(static_cast<unsigned char>(c)) == 0) {
      break;
    }
    language += static_cast<char>(
        std::tolower(static_cast<unsigned char>(c)));
  }
  if (language.size() > 2) {
    language.resize(2);
  }
  return language;
}

CatalogRegistry::CatalogRegistry() {
  catalogs_.emplace("en", EnglishCatalog());
  catalogs_.emplace("fr", FrenchCatalog());
}

void CatalogRegistry::Add(std::string_view tag, MessageCatalog catalog) {
  catalogs_.insert_or_assign(NormalizeLanguageTag(tag), std::move(catalog));
}

auto CatalogRegistry::Has(std::string_view tag) const -> bool {
  return catalogs_.contains(NormalizeLanguageTag(tag));
}

auto CatalogRegistry::Resolve(std::string_view tag) const
    -> const MessageCatalog& {
  auto it = catalogs_.find(NormalizeLanguageTag(tag));
  if (it != catalogs_.end()) {
    return it->second;
  }
  return catalogs_.at(std::string(kDefaultLanguage));
}

auto CatalogRegistry::Tags() const -> std::vector<std::string> {
  std::vector<std::string> tags;
  tags.reserve(catalogs_.size());
  for (const auto& [tag, catalog] : catalogs_) {
    tags.push_back(tag);
  }
  return tags;
}

}  // namespace sdkaudit::audit
