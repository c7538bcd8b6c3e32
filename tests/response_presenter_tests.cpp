#include <catch2/catch.hpp>

#include "src/domain/ResponsePresenter.h"

namespace presenter {

PresenterLayout smallLayout() {
  PresenterLayout layout;
  layout.briefCharLimit = 40;
  layout.columns = 12;
  layout.linesPerPage = 3;
  layout.continuationMarker = "...";
  return layout;
}

std::string joined(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

std::vector<std::string> allPages(ResponsePresenter& p) {
  std::vector<std::string> pages;
  while (true) {
    pages.push_back(joined(p.currentPage()));
    const size_t before = p.pageIndex();
    p.scroll(1);
    if (p.pageIndex() == before) break;
  }
  return pages;
}

const char kLong[] =
    "The quick brown fox jumps over the lazy dog while the cat watches from the warm windowsill.";

TEST_CASE("Word wrap respects the column width", "[presenter][wrap]") {
  const std::vector<std::string> lines = ResponsePresenter::wrap("one two three four five", 9);
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "one two");
  CHECK(lines[1] == "three");
  CHECK(lines[2] == "four five");
  for (size_t i = 0; i < lines.size(); ++i) CHECK(lines[i].size() <= 9);
}

TEST_CASE("Word wrap edge cases", "[presenter][wrap]") {
  SECTION("long words are split") {
    const std::vector<std::string> lines = ResponsePresenter::wrap("abcdefghijklmnop", 5);
    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "abcde");
    CHECK(lines[3] == "p");
  }
  SECTION("explicit newlines and blank lines are kept") {
    const std::vector<std::string> lines = ResponsePresenter::wrap("a\n\nb", 10);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "a");
    CHECK(lines[1].empty());
    CHECK(lines[2] == "b");
  }
  SECTION("runs of spaces collapse") {
    const std::vector<std::string> lines = ResponsePresenter::wrap("  a    b  ", 10);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "a b");
  }
  SECTION("multi-byte characters are not cut in half") {
    // Each "é" is two bytes; a 5 byte cut would land inside the third one.
    const std::vector<std::string> lines = ResponsePresenter::wrap("\xC3\xA9\xC3\xA9\xC3\xA9", 5);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "\xC3\xA9\xC3\xA9");
    CHECK(lines[1] == "\xC3\xA9");
  }
  SECTION("empty text has no lines") { CHECK(ResponsePresenter::wrap("", 10).empty()); }
}

TEST_CASE("Truncation ends on a word boundary with the marker", "[presenter][truncate]") {
  const std::string brief = ResponsePresenter::truncate(kLong, 40, "...");
  CHECK(brief == "The quick brown fox jumps over the lazy...");
  CHECK(ResponsePresenter::truncate("short", 40, "...") == "short");
}

TEST_CASE("Short text renders identically in both modes", "[presenter]") {
  const PresenterLayout layout = smallLayout();
  ResponsePresenter p(layout);
  const std::string text = "A cat on a mat.";
  p.load(text, true);
  CHECK_FALSE(p.truncated());

  const std::vector<std::string> brief = allPages(p);
  p.toggleVerbosity();
  CHECK(p.verbosity() == Verbosity::Verbose);
  const std::vector<std::string> verbose = allPages(p);
  CHECK(brief == verbose);
}

TEST_CASE("Long text BRIEF is a strict prefix of VERBOSE plus marker", "[presenter]") {
  const PresenterLayout layout = smallLayout();
  ResponsePresenter p(layout);
  const PresentationState& state = p.load(kLong, true);

  REQUIRE(state.truncated);
  const std::string marker = layout.continuationMarker;
  REQUIRE(state.briefText.size() > marker.size());
  CHECK(state.briefText.compare(state.briefText.size() - marker.size(), marker.size(), marker) == 0);
  const std::string prefix = state.briefText.substr(0, state.briefText.size() - marker.size());
  CHECK(prefix.size() < std::string(kLong).size());
  CHECK(std::string(kLong).compare(0, prefix.size(), prefix) == 0);
  CHECK(state.briefLines.size() < state.verboseLines.size());
}

TEST_CASE("Never-truncate text is shown whole in BRIEF", "[presenter]") {
  const PresenterLayout layout = smallLayout();
  ResponsePresenter p(layout);
  const PresentationState& state = p.load(kLong, false);
  CHECK_FALSE(state.truncated);
  CHECK(state.briefText == kLong);
  CHECK(state.briefLines == state.verboseLines);
}

TEST_CASE("Scrolling clamps at both ends and toggling resets", "[presenter][scroll]") {
  const PresenterLayout layout = smallLayout();
  ResponsePresenter p(layout);
  p.load(kLong, true);
  p.toggleVerbosity();  // VERBOSE: 9 lines at 12 columns -> 3 pages

  const size_t pages = p.pageCount();
  REQUIRE(pages > 1);
  p.scroll(-1);
  CHECK(p.pageIndex() == 0);
  p.scroll(100);
  CHECK(p.pageIndex() == pages - 1);
  p.scroll(1);
  CHECK(p.pageIndex() == pages - 1);
  CHECK_FALSE(p.currentPage().empty());

  p.toggleVerbosity();
  CHECK(p.pageIndex() == 0);
  CHECK(p.verbosity() == Verbosity::Brief);
}

TEST_CASE("Empty text still has one page", "[presenter]") {
  const PresenterLayout layout = smallLayout();
  ResponsePresenter p(layout);
  p.load("", true);
  CHECK(p.pageCount() == 1);
  CHECK(p.currentPage().empty());
  p.scroll(3);
  CHECK(p.pageIndex() == 0);
}

TEST_CASE("Clear drops the cached renderings", "[presenter]") {
  const PresenterLayout layout = smallLayout();
  ResponsePresenter p(layout);
  p.load(kLong, true);
  CHECK(p.loaded());
  p.clear();
  CHECK_FALSE(p.loaded());
  CHECK(p.state().verboseLines.empty());
}

}  // namespace presenter
