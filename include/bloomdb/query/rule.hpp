#pragma once

/** \file rule.hpp
 *  \brief Rule tree: column/value equality leaves combined by AND/OR groups.
 *
 * Ownership: value-semantic and self-contained; built once per request.
 */

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "bloomdb/value.hpp"

namespace bloomdb::query {

enum class condition { all_of, any_of }; /**< AND, OR */

/** \brief Recursive rule expression. */
struct rule {
  /** \brief column == value */
  struct leaf {
    std::string column;
    value val;
  };
  /** \brief AND/OR over ordered children; and([]) == true, or([]) == false. */
  struct group {
    condition cond{condition::all_of};
    std::vector<rule> children;
  };

  std::variant<leaf, group> node;
};

inline auto make_leaf(std::string column, value v) -> rule {
  return rule{rule::leaf{std::move(column), std::move(v)}};
}

inline auto make_and(std::vector<rule> children) -> rule {
  return rule{rule::group{condition::all_of, std::move(children)}};
}

inline auto make_or(std::vector<rule> children) -> rule {
  return rule{rule::group{condition::any_of, std::move(children)}};
}

} // namespace bloomdb::query
