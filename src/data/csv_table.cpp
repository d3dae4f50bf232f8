#include "bloomdb/data/table_source.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace bloomdb::data {

namespace {

struct Cell {
  std::string text;
  bool quoted{false};
};

// Splits one logical record starting at pos; quoted fields may span lines.
// Returns nullopt on an unterminated quote.
auto next_record(std::string_view text, std::size_t& pos, const CsvOptions& opt)
    -> std::optional<std::vector<Cell>> {
  std::vector<Cell> cells;
  Cell cur;
  bool in_quotes = false;
  while (pos < text.size()) {
    const char c = text[pos];
    if (in_quotes) {
      if (c == opt.quote) {
        if (pos + 1 < text.size() && text[pos + 1] == opt.quote) {
          cur.text.push_back(opt.quote);
          pos += 2;
          continue;
        }
        in_quotes = false;
        ++pos;
        continue;
      }
      cur.text.push_back(c);
      ++pos;
      continue;
    }
    if (c == opt.quote && cur.text.empty() && !cur.quoted) {
      in_quotes = true;
      cur.quoted = true;
      ++pos;
    } else if (c == opt.delimiter) {
      cells.push_back(std::move(cur));
      cur = Cell{};
      ++pos;
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') ++pos;
      ++pos;
      break;
    } else {
      cur.text.push_back(c);
      ++pos;
    }
  }
  if (in_quotes) return std::nullopt;
  cells.push_back(std::move(cur));
  return cells;
}

inline auto blank(const std::vector<Cell>& cells) -> bool {
  return cells.size() == 1 && cells[0].text.empty() && !cells[0].quoted;
}

// A column is numeric only when every cell is unquoted and parses as a number;
// otherwise every cell keeps its text.
auto type_column(std::vector<Cell> cells) -> std::vector<value> {
  std::vector<value> out;
  out.reserve(cells.size());
  bool numeric = true;
  for (const auto& c : cells) {
    if (c.quoted) { numeric = false; break; }
    auto v = parse_cell(c.text);
    if (std::holds_alternative<std::string>(v)) { numeric = false; break; }
    out.push_back(std::move(v));
  }
  if (numeric) return out;
  out.clear();
  for (auto& c : cells) out.emplace_back(std::move(c.text));
  return out;
}

} // namespace

auto CsvTable::load(const std::string& path, CsvOptions options)
    -> std::expected<CsvTable, core::error> {
  std::ifstream is(path, std::ios::binary);
  if (!is) {
    return std::unexpected(core::error{core::error_code::data_source, "cannot open " + path, "data.csv"});
  }
  std::ostringstream buf;
  buf << is.rdbuf();
  if (is.bad()) {
    return std::unexpected(core::error{core::error_code::data_source, "read failed for " + path, "data.csv"});
  }
  return parse(buf.str(), path, options);
}

auto CsvTable::parse(std::string_view text, std::string source_path, CsvOptions options)
    -> std::expected<CsvTable, core::error> {
  using core::error; using core::error_code;
  CsvTable t;
  t.source_path_ = std::move(source_path);

  std::size_t pos = 0;
  if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") pos = 3;

  auto header = next_record(text, pos, options);
  if (!header || blank(*header)) {
    return std::unexpected(error{error_code::data_source, "missing header row in " + t.source_path_, "data.csv"});
  }
  for (auto& c : *header) t.names_.push_back(std::move(c.text));
  t.columns_.resize(t.names_.size());

  // Raw cells per column; typing happens once the whole column is known.
  std::vector<std::vector<Cell>> raw(t.names_.size());
  std::size_t line = 1;
  while (pos < text.size()) {
    auto rec = next_record(text, pos, options);
    ++line;
    if (!rec) {
      return std::unexpected(error{error_code::data_source,
          "unterminated quote in " + t.source_path_ + " record " + std::to_string(line), "data.csv"});
    }
    if (blank(*rec)) continue;
    if (rec->size() != t.names_.size()) {
      return std::unexpected(error{error_code::data_source,
          "record " + std::to_string(line) + " of " + t.source_path_ + " has " + std::to_string(rec->size()) +
          " fields, expected " + std::to_string(t.names_.size()), "data.csv"});
    }
    for (std::size_t i = 0; i < rec->size(); ++i) {
      auto& cell = (*rec)[i];
      if (cell.quoted || !cell.text.empty()) raw[i].push_back(std::move(cell));
    }
    ++t.rows_;
  }

  for (std::size_t i = 0; i < raw.size(); ++i) {
    t.columns_[i] = type_column(std::move(raw[i]));
  }
  return t;
}

} // namespace bloomdb::data
