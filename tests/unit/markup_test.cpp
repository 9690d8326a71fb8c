#include <gtest/gtest.h>

#include <string>

#include "sdkaudit/common/markup.hpp"

namespace sdkaudit::common {
namespace {

constexpr auto kPassed =
    "<color=#90ee90>TEST PASSED</color> → found. Path: C:\\dotnet\\";

TEST(MarkupTest, RawKeepsTags) {
  EXPECT_EQ(RenderMarkup(kPassed, MarkupMode::kRaw), kPassed);
}

TEST(MarkupTest, PlainStripsTags) {
  EXPECT_EQ(
      RenderMarkup(kPassed, MarkupMode::kPlain),
      "TEST PASSED → found. Path: C:\\dotnet\\");
  EXPECT_EQ(
      RenderMarkup("<color=red>a<color=yellow>b</color>c</color>d",
                   MarkupMode::kPlain),
      "abcd");
}

TEST(MarkupTest, PlainDropsStrayCloseAndKeepsUnterminatedOpen) {
  EXPECT_EQ(RenderMarkup("x</color>y", MarkupMode::kPlain), "xy");
  EXPECT_EQ(RenderMarkup("x<color=red y", MarkupMode::kPlain), "x<color=red y");
}

TEST(MarkupTest, AnsiColorsSpans) {
  auto rendered = RenderMarkup(kPassed, MarkupMode::kAnsi);
  EXPECT_NE(rendered.find("\x1b["), std::string::npos);
  EXPECT_NE(rendered.find("TEST PASSED"), std::string::npos);
  EXPECT_EQ(rendered.find("<color"), std::string::npos);
  // Text outside the span is not styled.
  EXPECT_NE(rendered.find(" → found. Path: C:\\dotnet\\"), std::string::npos);
}

TEST(MarkupTest, AnsiUnknownColorIsUnstyled) {
  EXPECT_EQ(RenderMarkup("<color=chartreuse>ok</color>", MarkupMode::kAnsi),
            "ok");
}

TEST(MarkupTest, ParseMode) {
  EXPECT_EQ(ParseMarkupMode("ansi"), MarkupMode::kAnsi);
  EXPECT_EQ(ParseMarkupMode("plain"), MarkupMode::kPlain);
  EXPECT_EQ(ParseMarkupMode("raw"), MarkupMode::kRaw);
  EXPECT_FALSE(ParseMarkupMode("html").has_value());
}

}  // namespace
}  // namespace sdkaudit::common
