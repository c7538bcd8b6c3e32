// ResponsePresenter.cpp

#include "ResponsePresenter.h"

namespace {

bool isUtf8Continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r';
}

// Wraps one paragraph (no '\n') into `out`.
void wrapParagraph(const std::string& para, size_t columns, std::vector<std::string>& out) {
  std::string line;
  size_t i = 0;
  while (i < para.size()) {
    while (i < para.size() && isSpace(para[i])) ++i;
    if (i >= para.size()) break;
    size_t end = i;
    while (end < para.size() && !isSpace(para[end])) ++end;
    std::string word = para.substr(i, end - i);
    i = end;

    if (!line.empty() && line.size() + 1 + word.size() <= columns) {
      line += ' ';
      line += word;
      continue;
    }
    if (!line.empty()) {
      out.push_back(line);
      line.clear();
    }
    // Split words that cannot fit on a line of their own.
    while (word.size() > columns) {
      size_t cut = columns;
      while (cut > 0 && isUtf8Continuation(word[cut])) --cut;
      if (cut == 0) cut = columns;
      out.push_back(word.substr(0, cut));
      word.erase(0, cut);
    }
    line = word;
  }
  if (!line.empty()) out.push_back(line);
}

}  // namespace

std::vector<std::string> ResponsePresenter::wrap(const std::string& text, size_t columns) {
  std::vector<std::string> lines;
  if (columns == 0) columns = 1;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    std::string para = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    const size_t before = lines.size();
    wrapParagraph(para, columns, lines);
    if (lines.size() == before && nl != std::string::npos) lines.push_back(std::string());
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  return lines;
}

std::string ResponsePresenter::truncate(const std::string& text, size_t limit, const std::string& marker) {
  if (text.size() <= limit) return text;

  size_t cut = limit;
  while (cut > 0 && isUtf8Continuation(text[cut])) --cut;

  // Prefer ending on a word boundary in the second half of the window.
  size_t boundary = cut;
  while (boundary > cut / 2 && !isSpace(text[boundary]) && text[boundary] != '\n') --boundary;
  if (boundary > cut / 2) cut = boundary;
  while (cut > 0 && (isSpace(text[cut - 1]) || text[cut - 1] == '\n')) --cut;

  return text.substr(0, cut) + marker;
}

const PresentationState& ResponsePresenter::load(const std::string& text, bool allowTruncation) {
  state_ = PresentationState();
  state_.truncated = allowTruncation && text.size() > layout_.briefCharLimit;
  state_.briefText = state_.truncated ? truncate(text, layout_.briefCharLimit, layout_.continuationMarker) : text;
  state_.verboseLines = wrap(text, layout_.columns);
  state_.briefLines = state_.truncated ? wrap(state_.briefText, layout_.columns) : state_.verboseLines;
  loaded_ = true;
  return state_;
}

void ResponsePresenter::toggleVerbosity() {
  state_.mode = state_.mode == Verbosity::Brief ? Verbosity::Verbose : Verbosity::Brief;
  state_.page = 0;
}

size_t ResponsePresenter::pageCount() const {
  const size_t perPage = layout_.linesPerPage == 0 ? 1 : layout_.linesPerPage;
  const size_t lines = activeLines().size();
  if (lines == 0) return 1;
  return (lines + perPage - 1) / perPage;
}

void ResponsePresenter::scroll(int delta) {
  if (delta < 0) {
    const size_t back = static_cast<size_t>(-delta);
    state_.page = back > state_.page ? 0 : state_.page - back;
    return;
  }
  const size_t last = pageCount() - 1;
  const size_t target = state_.page + static_cast<size_t>(delta);
  state_.page = target > last ? last : target;
}

std::vector<std::string> ResponsePresenter::currentPage() const {
  const size_t perPage = layout_.linesPerPage == 0 ? 1 : layout_.linesPerPage;
  const std::vector<std::string>& lines = activeLines();
  const size_t first = state_.page * perPage;
  std::vector<std::string> page;
  for (size_t i = first; i < lines.size() && i < first + perPage; ++i) page.push_back(lines[i]);
  return page;
}

void ResponsePresenter::clear() {
  state_ = PresentationState();
  loaded_ = false;
}
