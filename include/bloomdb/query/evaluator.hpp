#pragma once

/** \file evaluator.hpp
 *  \brief Evaluation of a rule tree against one file's column indexes.
 *
 * Verdicts are "might match": false is exact (no satisfying row exists), true
 * may be a false positive. A leaf naming a column absent from the index is false.
 */

#include <memory>
#include <string>
#include <vector>

#include "bloomdb/file_index.hpp"
#include "bloomdb/query/rule.hpp"

namespace bloomdb::query {

// Whether the file indexed by idx might satisfy expr.
auto evaluate(const rule& expr, const FileIndex& idx) -> bool;

// Source paths of the indexes that might satisfy expr, in input order.
auto candidate_files(const rule& expr, const std::vector<std::shared_ptr<const FileIndex>>& indexes)
    -> std::vector<std::string>;

} // namespace bloomdb::query
