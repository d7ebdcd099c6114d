/***
 * Name: nestport::group::flatten
 * Purpose: Depth-first reconstruction of the original token sequence.
 */
#include "grouping/Flatten.h"

namespace nestport::group {

void appendFlattened(const Element& element, std::vector<lex::Token>& out) {
  if (element.isToken()) {
    out.push_back(element.token());
    return;
  }
  const auto& grp = element.group();
  out.push_back(grp.open);
  for (const auto& child : grp.children) { appendFlattened(child, out); }
  out.push_back(grp.close);
}

std::vector<lex::Token> flatten(const TokenGroup& group) {
  std::vector<lex::Token> out;
  if (group.kind != GroupKind::Root) { out.push_back(group.open); }
  for (const auto& child : group.children) { appendFlattened(child, out); }
  if (group.kind != GroupKind::Root) { out.push_back(group.close); }
  return out;
}

std::string describe(const Element& element) { return element.firstToken().text; }

} // namespace nestport::group
