#include "ConsoleSelection.hpp"

#include <istream>
#include <ostream>
#include <set>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace psm {

std::vector<std::string> preselected_paths(const std::vector<Candidate>& candidates) {
  std::vector<std::string> out;
  for (const auto& c : candidates) {
    if (c.preselected) out.push_back(c.path);
  }
  return out;
}

std::optional<std::vector<std::string>> parse_selection(
    const std::string& line, const std::vector<Candidate>& candidates) {
  std::string s;
  for (char ch : line) s += (ch == ',' || ch == '\t' || ch == '\r') ? ' ' : ch;
  const auto first = s.find_first_not_of(' ');
  if (first == std::string::npos) return preselected_paths(candidates);
  s = s.substr(first, s.find_last_not_of(' ') - first + 1);

  if (s == "none") return std::vector<std::string>{};
  if (s == "all") {
    std::vector<std::string> out;
    for (const auto& c : candidates) out.push_back(c.path);
    return out;
  }

  std::set<size_t> picked;
  size_t pos = 0;
  while (pos < s.size()) {
    if (s[pos] == ' ') { ++pos; continue; }
    size_t end = s.find(' ', pos);
    if (end == std::string::npos) end = s.size();
    const std::string tok = s.substr(pos, end - pos);
    pos = end;

    size_t used = 0;
    unsigned long n = 0;
    try {
      n = std::stoul(tok, &used);
    } catch (const std::logic_error&) {
      return std::nullopt;
    }
    if (used != tok.size() || n == 0 || n > candidates.size()) return std::nullopt;
    picked.insert(n - 1);
  }

  std::vector<std::string> out;
  for (size_t idx : picked) out.push_back(candidates[idx].path);
  return out;
}

std::vector<std::string> ConsoleSelection::choose(const std::vector<Candidate>& candidates) {
  if (candidates.empty()) return {};

  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& c = candidates[i];
    out_ << (c.preselected ? "## " : "   ") << (i + 1) << ". " << c.path;
    if (c.already_cataloged) out_ << "  [already cataloged]";
    if (!c.record) out_ << "  [no metadata]";
    out_ << "\n";
  }

  std::string line;
  for (;;) {
    out_ << "Select [Enter = marked, all, none, or numbers]: " << std::flush;
    if (!std::getline(in_, line)) {
      spdlog::debug("selection input closed; keeping preselection");
      return preselected_paths(candidates);
    }
    if (auto chosen = parse_selection(line, candidates)) return *chosen;
    out_ << "Unrecognized selection: " << line << "\n";
  }
}

} // namespace psm
