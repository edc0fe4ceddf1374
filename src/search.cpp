#include "search.hpp"
#include <re2/re2.h>

std::optional<Match> PlainSearcher::find_first(std::string_view text) const {
  size_t pos = text.find(pat_);
  if (pos == std::string_view::npos) return std::nullopt;
  return Match{pos, pos + pat_.size()};
}

std::vector<Match> PlainSearcher::find_all(std::string_view text) const {
  std::vector<Match> out;
  if (pat_.empty()) {
    // every position matches the empty pattern, including the end
    out.reserve(text.size() + 1);
    for (size_t i = 0; i <= text.size(); ++i) out.push_back({i, i});
    return out;
  }
  size_t pos = text.find(pat_);
  while (pos != std::string_view::npos) {
    out.push_back({pos, pos + pat_.size()});
    pos = text.find(pat_, pos + pat_.size());
  }
  return out;
}

bool PlainSearcher::set_pattern(const std::string& pat, std::string& msg) {
  pat_ = pat;
  msg.clear();
  return true;
}

static std::unique_ptr<re2::RE2> compile(const std::string& pat) {
  re2::RE2::Options opt;
  opt.set_log_errors(false);
  return std::make_unique<re2::RE2>(pat, opt);
}

RegexSearcher::RegexSearcher() : re_(compile("")) {}

RegexSearcher::~RegexSearcher() = default;

std::optional<Match> RegexSearcher::find_first(std::string_view text) const {
  re2::StringPiece in(text.data(), text.size());
  re2::StringPiece m;
  if (!re_->Match(in, 0, in.size(), re2::RE2::UNANCHORED, &m, 1)) return std::nullopt;
  size_t s = static_cast<size_t>(m.data() - in.data());
  return Match{s, s + m.size()};
}

std::vector<Match> RegexSearcher::find_all(std::string_view text) const {
  std::vector<Match> out;
  re2::StringPiece in(text.data(), text.size());
  re2::StringPiece m;
  size_t pos = 0;
  while (pos <= in.size() && re_->Match(in, pos, in.size(), re2::RE2::UNANCHORED, &m, 1)) {
    size_t s = static_cast<size_t>(m.data() - in.data());
    size_t e = s + m.size();
    out.push_back({s, e});
    // an empty match must not stall the scan
    pos = e > s ? e : e + 1;
  }
  return out;
}

bool RegexSearcher::set_pattern(const std::string& pat, std::string& msg) {
  auto re = compile(pat);
  if (!re->ok()) {
    msg = "invalid pattern: " + re->error();
    return false;
  }
  re_ = std::move(re);
  pat_ = pat;
  msg.clear();
  return true;
}

std::shared_ptr<ISearcher> make_searcher(bool fixed_strings) {
  if (fixed_strings) return std::make_shared<PlainSearcher>();
  return std::make_shared<RegexSearcher>();
}
