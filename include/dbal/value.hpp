#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace dbal {

// A scalar as it travels between records, restrictions and result sets.
using Value = std::variant<std::nullptr_t, int64_t, double, bool, std::string>;

// One fetched row, column name -> value.
using Row = std::map<std::string, Value>;

inline bool is_null(const Value& v) { return std::holds_alternative<std::nullptr_t>(v); }

// Human readable rendition (logs, test output). Not SQL safe.
std::string to_string(const Value& v);

} // namespace dbal
