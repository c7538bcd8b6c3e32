// ResponsePresenter.h
// BRIEF/VERBOSE disclosure, word wrapping and pagination of one analysis text.
// Both renderings are wrapped and paginated once in load(); toggling and
// scrolling only move indices.

#pragma once

#include <stddef.h>

#include <string>
#include <vector>

#include "Settings.h"

enum class Verbosity {
  Brief,
  Verbose,
};

struct PresentationState {
  Verbosity mode = Verbosity::Brief;
  size_t page = 0;                   // always within [0, pageCount-1]
  std::string briefText;             // text the BRIEF pages were built from
  bool truncated = false;            // BRIEF differs from VERBOSE
  std::vector<std::string> briefLines;
  std::vector<std::string> verboseLines;
};

class ResponsePresenter {
 public:
  explicit ResponsePresenter(const PresenterLayout& layout) : layout_(layout) {}

  // Builds both renderings. `allowTruncation` is false for never-truncate
  // prompts; BRIEF then renders the full text.
  const PresentationState& load(const std::string& text, bool allowTruncation);

  // Switches BRIEF <-> VERBOSE and returns to the first page.
  void toggleVerbosity();

  // Moves by `delta` pages, clamped to the available pages.
  void scroll(int delta);

  std::vector<std::string> currentPage() const;

  size_t pageCount() const;
  size_t pageIndex() const { return state_.page; }
  Verbosity verbosity() const { return state_.mode; }
  bool truncated() const { return state_.truncated; }
  bool loaded() const { return loaded_; }
  const PresentationState& state() const { return state_; }

  // Drops the cached renderings when the viewer closes.
  void clear();

  // Greedy word wrap at `columns`; words longer than a line are split and
  // explicit newlines are kept (blank lines included). Exposed for tests.
  static std::vector<std::string> wrap(const std::string& text, size_t columns);

  // BRIEF text: the longest prefix of at most `limit` bytes ending on a word
  // boundary where possible, followed by `marker`. Exposed for tests.
  static std::string truncate(const std::string& text, size_t limit, const std::string& marker);

 private:
  const PresenterLayout& layout_;
  PresentationState state_;
  bool loaded_ = false;

  const std::vector<std::string>& activeLines() const {
    return state_.mode == Verbosity::Brief ? state_.briefLines : state_.verboseLines;
  }
};
