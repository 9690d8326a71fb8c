#include <gtest/gtest.h>

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "sdkaudit/audit/audit_result.hpp"
#include "sdkaudit/audit/auditor.hpp"
#include "sdkaudit/audit/message_catalog.hpp"
#include "sdkaudit/audit/outcome.hpp"
#include "sdkaudit/audit/result_store.hpp"
#include "sdkaudit/common/diagnostic.hpp"

namespace sdkaudit::audit {
namespace {

constexpr auto kSdk64 = R"(C:\Program Files\dotnet\)";
constexpr auto kSdk32 = R"(C:\Program Files (x86)\dotnet\)";
constexpr auto kSdk64OnD = R"(D:\Program Files\dotnet\)";

// Store whose reads and writes always fail.
class BrokenResultStore final : public ResultStore {
 public:
  auto Load() -> Result<std::optional<AuditResult>> override {
    ++loads;
    return std::unexpected(Diagnostic::HostError("store offline"));
  }
  auto Save(const AuditResult& /*result*/) -> Result<void> override {
    ++saves;
    return std::unexpected(Diagnostic::HostError("store offline"));
  }
  auto Clear() -> Result<void> override {
    return {};
  }

  int loads = 0;
  int saves = 0;
};

class AuditorTest : public ::testing::Test {
 protected:
  auto MakeAuditor(bool show_positive = false) -> SdkPathAuditor {
    return SdkPathAuditor(
        AuditOptions{.show_positive_messages = show_positive}, catalogs_,
        "en", store_);
  }

  std::vector<std::string> roots_ = {"C:\\"};
  CatalogRegistry catalogs_;
  MemoryResultStore store_;
};

// =============================================================================
// Scanning
// =============================================================================

TEST_F(AuditorTest, Scan64OnlyRecordsPath) {
  std::string path = std::string(R"(C:\Windows;)") + kSdk64;
  auto result = ScanSearchPath(path, roots_, "dotnet\\");

  EXPECT_TRUE(result.has64);
  EXPECT_FALSE(result.has32);
  EXPECT_EQ(result.path64, kSdk64);
  EXPECT_EQ(result.path32, "");
  EXPECT_TRUE(result.has64_first);
}

TEST_F(AuditorTest, ScanEmptyInputsFindNothing) {
  auto result = ScanSearchPath("", {}, "dotnet\\");
  EXPECT_EQ(
      result, (AuditResult{
                  .has32 = false,
                  .has64 = false,
                  .has64_first = true,
                  .path32 = "",
                  .path64 = "",
              }));

  EXPECT_EQ(Classify(ScanSearchPath(kSdk64, {}, "dotnet\\")),
            AuditOutcome::kNotFound);
  EXPECT_EQ(Classify(ScanSearchPath("", roots_, "dotnet\\")),
            AuditOutcome::kNotFound);
}

TEST_F(AuditorTest, ScanFindsBitnessesOnDifferentVolumes) {
  std::vector<std::string> roots = {"C:\\", "D:\\"};
  std::string path = std::string(kSdk32) + ";" + kSdk64OnD;
  auto result = ScanSearchPath(path, roots, "dotnet\\");

  EXPECT_TRUE(result.has32);
  EXPECT_TRUE(result.has64);
  EXPECT_EQ(result.path32, kSdk32);
  EXPECT_EQ(result.path64, kSdk64OnD);
  // Position in the search path decides, not the volume order.
  EXPECT_FALSE(result.has64_first);
}

TEST_F(AuditorTest, ScanFirstMatchingVolumeWins) {
  std::vector<std::string> roots = {"D:\\", "C:\\"};
  std::string path = std::string(kSdk64) + ";" + kSdk64OnD;
  auto result = ScanSearchPath(path, roots, "dotnet\\");

  EXPECT_EQ(result.path64, kSdk64OnD);
}

TEST_F(AuditorTest, ScanUsesConfiguredMarker) {
  std::string path = R"(C:\Program Files\Java\bin)";
  auto result = ScanSearchPath(path, roots_, "Java\\");

  EXPECT_TRUE(result.has64);
  EXPECT_EQ(result.path64, R"(C:\Program Files\Java\)");
}

// =============================================================================
// Classification
// =============================================================================

TEST_F(AuditorTest, OrderDecidesBothPresentOutcome) {
  std::string correct = std::string(kSdk64) + ";" + kSdk32;
  std::string wrong = std::string(kSdk32) + ";" + kSdk64;

  EXPECT_EQ(Classify(ScanSearchPath(correct, roots_, "dotnet\\")),
            AuditOutcome::kBothCorrectOrder);
  EXPECT_EQ(Classify(ScanSearchPath(wrong, roots_, "dotnet\\")),
            AuditOutcome::kBothWrongOrder);
}

TEST_F(AuditorTest, ClassifyIsTotalOverFlags) {
  for (int bits = 0; bits < 8; ++bits) {
    AuditResult result{
        .has32 = (bits & 1) != 0,
        .has64 = (bits & 2) != 0,
        .has64_first = (bits & 4) != 0,
    };
    auto outcome = Classify(result);
    EXPECT_NE(outcome, AuditOutcome::kUnchanged);

    if (!result.has32 && !result.has64) {
      EXPECT_EQ(outcome, AuditOutcome::kNotFound);
    }
  }
}

TEST_F(AuditorTest, SingleBitnessIgnoresOrderFlag) {
  for (bool first : {true, false}) {
    EXPECT_EQ(
        Classify(AuditResult{.has32 = false, .has64 = true, .has64_first = first}),
        AuditOutcome::kSdk64Only);
    EXPECT_EQ(
        Classify(AuditResult{.has32 = true, .has64 = false, .has64_first = first}),
        AuditOutcome::kSdk32Only);
  }
}

// =============================================================================
// Change detection and display
// =============================================================================

TEST_F(AuditorTest, NotFoundIsAlwaysShown) {
  auto auditor = MakeAuditor(false);
  auto report = auditor.Audit(R"(C:\Windows)", roots_);

  EXPECT_EQ(report.outcome, AuditOutcome::kNotFound);
  ASSERT_TRUE(report.message.has_value());
  EXPECT_NE(report.message->find("TEST FAILED"), std::string::npos);
}

TEST_F(AuditorTest, SecondIdenticalCallIsUnchanged) {
  auto auditor = MakeAuditor();
  std::string path = std::string(kSdk32) + ";" + kSdk64;

  auto first = auditor.Audit(path, roots_);
  auto second = auditor.Audit(path, roots_);

  EXPECT_EQ(first.outcome, AuditOutcome::kBothWrongOrder);
  EXPECT_TRUE(first.message.has_value());
  EXPECT_EQ(second.outcome, AuditOutcome::kUnchanged);
  EXPECT_FALSE(second.message.has_value());
}

TEST_F(AuditorTest, ChangedPathReportsAgain) {
  auto auditor = MakeAuditor();
  std::string wrong = std::string(kSdk32) + ";" + kSdk64;
  std::string correct = std::string(kSdk64) + ";" + kSdk32;

  EXPECT_EQ(auditor.Audit(wrong, roots_).outcome, AuditOutcome::kBothWrongOrder);
  EXPECT_EQ(
      auditor.Audit(correct, roots_).outcome, AuditOutcome::kBothCorrectOrder);
  EXPECT_EQ(auditor.Audit(wrong, roots_).outcome, AuditOutcome::kBothWrongOrder);
}

TEST_F(AuditorTest, ChangedMatchedVolumeReportsAgain) {
  auto auditor = MakeAuditor(true);
  std::vector<std::string> roots = {"C:\\", "D:\\"};

  EXPECT_EQ(auditor.Audit(kSdk64, roots).outcome, AuditOutcome::kSdk64Only);
  auto moved = auditor.Audit(kSdk64OnD, roots);
  EXPECT_EQ(moved.outcome, AuditOutcome::kSdk64Only);
  EXPECT_EQ(moved.result.path64, kSdk64OnD);
}

TEST_F(AuditorTest, ResultIsPersisted) {
  auto auditor = MakeAuditor();
  auto report = auditor.Audit(kSdk32, roots_);

  auto stored = store_.Load();
  ASSERT_TRUE(stored.has_value());
  ASSERT_TRUE(stored->has_value());
  EXPECT_EQ(**stored, report.result);
}

TEST_F(AuditorTest, PositiveOutcomesSuppressedByDefault) {
  auto auditor = MakeAuditor(false);

  auto only64 = auditor.Audit(kSdk64, roots_);
  EXPECT_EQ(only64.outcome, AuditOutcome::kSdk64Only);
  EXPECT_FALSE(only64.message.has_value());

  auto both = auditor.Audit(std::string(kSdk64) + ";" + kSdk32, roots_);
  EXPECT_EQ(both.outcome, AuditOutcome::kBothCorrectOrder);
  EXPECT_FALSE(both.message.has_value());

  // Suppressed results are still recorded.
  EXPECT_EQ(
      auditor.Audit(std::string(kSdk64) + ";" + kSdk32, roots_).outcome,
      AuditOutcome::kUnchanged);
}

TEST_F(AuditorTest, PositiveOutcomesShownWhenEnabled) {
  auto auditor = MakeAuditor(true);
  auto report = auditor.Audit(kSdk64, roots_);

  ASSERT_TRUE(report.message.has_value());
  EXPECT_NE(report.message->find("TEST PASSED"), std::string::npos);
  EXPECT_NE(report.message->find(kSdk64), std::string::npos);
}

TEST_F(AuditorTest, NegativeOutcomesShownWhenPositiveDisabled) {
  auto auditor = MakeAuditor(false);

  auto only32 = auditor.Audit(kSdk32, roots_);
  EXPECT_EQ(only32.outcome, AuditOutcome::kSdk32Only);
  EXPECT_TRUE(only32.message.has_value());

  auto wrong = auditor.Audit(std::string(kSdk32) + ";" + kSdk64, roots_);
  EXPECT_EQ(wrong.outcome, AuditOutcome::kBothWrongOrder);
  EXPECT_TRUE(wrong.message.has_value());
}

TEST_F(AuditorTest, MessageLayout) {
  auto auditor = MakeAuditor();
  std::string path = std::string(kSdk32) + ";" + kSdk64;
  auto report = auditor.Audit(path, roots_);
  ASSERT_TRUE(report.message.has_value());

  const auto& catalog = catalogs_.Resolve("en");
  std::string expected = catalog.Get(MessageId::kBothWrongOrder) + kSdk32 +
                         catalog.Get(MessageId::kExplanation) +
                         catalog.FormatSystemPath(path);
  EXPECT_EQ(*report.message, expected);
}

TEST_F(AuditorTest, StoreFailureStillReports) {
  BrokenResultStore broken;
  SdkPathAuditor auditor(AuditOptions{}, catalogs_, "en", broken);

  auto first = auditor.Audit(kSdk32, roots_);
  auto second = auditor.Audit(kSdk32, roots_);

  EXPECT_EQ(first.outcome, AuditOutcome::kSdk32Only);
  EXPECT_EQ(second.outcome, AuditOutcome::kSdk32Only);
  EXPECT_TRUE(second.message.has_value());
  EXPECT_EQ(broken.loads, 2);
  EXPECT_EQ(broken.saves, 2);
}

TEST_F(AuditorTest, AllFalseResultMatchesEmptyStore) {
  // A stored all-false record with has64_first = true equals a fresh
  // not-found scan, so nothing is reported.
  ASSERT_TRUE(store_
                  .Save(AuditResult{
                      .has32 = false,
                      .has64 = false,
                      .has64_first = true,
                  })
                  .has_value());
  auto auditor = MakeAuditor();
  EXPECT_EQ(auditor.Audit("", roots_).outcome, AuditOutcome::kUnchanged);
}

// =============================================================================
// Language selection
// =============================================================================

TEST_F(AuditorTest, UiLanguageSelectsCatalog) {
  SdkPathAuditor auditor(AuditOptions{}, catalogs_, "fr", store_);
  auto report = auditor.Audit("", roots_);

  ASSERT_TRUE(report.message.has_value());
  EXPECT_NE(report.message->find("TEST ÉCHOUÉ"), std::string::npos);
}

TEST_F(AuditorTest, ForcedLanguageAppliesToOneCall) {
  SdkPathAuditor auditor(AuditOptions{}, catalogs_, "fr", store_);

  auto forced = auditor.Audit("", roots_, "en");
  ASSERT_TRUE(forced.message.has_value());
  EXPECT_NE(forced.message->find("TEST FAILED"), std::string::npos);

  auto next = auditor.Audit(kSdk32, roots_);
  ASSERT_TRUE(next.message.has_value());
  EXPECT_NE(next.message->find("TEST ÉCHOUÉ"), std::string::npos);
}

TEST_F(AuditorTest, UnknownLanguageFallsBackToEnglish) {
  SdkPathAuditor auditor(AuditOptions{}, catalogs_, "xx", store_);
  auto report = auditor.Audit("", roots_);

  ASSERT_TRUE(report.message.has_value());
  EXPECT_NE(report.message->find("TEST FAILED"), std::string::npos);
}

}  // namespace
}  // namespace sdkaudit::audit
