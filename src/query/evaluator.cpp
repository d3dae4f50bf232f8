#include "bloomdb/query/evaluator.hpp"

namespace bloomdb::query {

static auto matches_node(const rule& e, const FileIndex& idx) -> bool {
  if (std::holds_alternative<rule::leaf>(e.node)) {
    const auto& l = std::get<rule::leaf>(e.node);
    const auto* col = idx.find(l.column);
    return col != nullptr && col->contains(l.val);
  }
  const auto& g = std::get<rule::group>(e.node);
  if (g.cond == condition::all_of) {
    for (const auto& c : g.children) if (!matches_node(c, idx)) return false;
    return true; // and([]) == true
  }
  for (const auto& c : g.children) if (matches_node(c, idx)) return true;
  return false; // or([]) == false
}

auto evaluate(const rule& expr, const FileIndex& idx) -> bool {
  return matches_node(expr, idx);
}

auto candidate_files(const rule& expr, const std::vector<std::shared_ptr<const FileIndex>>& indexes)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& idx : indexes) {
    if (idx && evaluate(expr, *idx)) out.push_back(idx->source_path());
  }
  return out;
}

} // namespace bloomdb::query
