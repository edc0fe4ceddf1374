#pragma once
/*
 * Search
 *
 * Purpose: pattern matchers shared by the pane (highlight) and the app (jump).
 * Contract: set_pattern() rejects invalid input and keeps the old pattern;
 *           offsets are byte offsets into the searched line.
 */
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 { class RE2; }

struct Match {
  size_t start = 0;
  size_t end = 0;
  bool operator==(const Match& o) const { return start == o.start && end == o.end; }
};

class ISearcher {
public:
  virtual ~ISearcher() = default;
  virtual const std::string& pattern() const = 0;
  virtual std::optional<Match> find_first(std::string_view text) const = 0;
  virtual std::vector<Match> find_all(std::string_view text) const = 0;
  virtual bool set_pattern(const std::string& pat, std::string& msg) = 0;
};

class NullSearcher : public ISearcher {
public:
  const std::string& pattern() const override { return pat_; }
  std::optional<Match> find_first(std::string_view) const override { return std::nullopt; }
  std::vector<Match> find_all(std::string_view) const override { return {}; }
  bool set_pattern(const std::string&, std::string&) override { return true; }
private:
  std::string pat_;
};

class PlainSearcher : public ISearcher {
public:
  const std::string& pattern() const override { return pat_; }
  std::optional<Match> find_first(std::string_view text) const override;
  std::vector<Match> find_all(std::string_view text) const override;
  bool set_pattern(const std::string& pat, std::string& msg) override;
private:
  std::string pat_;
};

// RE2 matches in linear time without recursing on the input, so long lines are safe.
class RegexSearcher : public ISearcher {
public:
  RegexSearcher();
  ~RegexSearcher() override;
  const std::string& pattern() const override { return pat_; }
  std::optional<Match> find_first(std::string_view text) const override;
  std::vector<Match> find_all(std::string_view text) const override;
  bool set_pattern(const std::string& pat, std::string& msg) override;
private:
  std::string pat_;
  std::unique_ptr<re2::RE2> re_;
};

std::shared_ptr<ISearcher> make_searcher(bool fixed_strings);
