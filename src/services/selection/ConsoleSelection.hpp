#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "SelectionSurface.hpp"

namespace psm {

// Reply grammar: empty line keeps the preselection, "all", "none", or
// 1-based indices separated by spaces or commas. nullopt if unparsable.
std::optional<std::vector<std::string>> parse_selection(
    const std::string& line, const std::vector<Candidate>& candidates);

// Lists candidates ("## " marks preselected ones) and reads the reply from
// `in`. End of input keeps the preselection.
class ConsoleSelection : public SelectionSurface {
public:
  ConsoleSelection(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

  std::vector<std::string> choose(const std::vector<Candidate>& candidates) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

} // namespace psm
