#include "errors.hpp"

namespace ducksql::util {
namespace {

std::string RenderUnknownColumn(const std::string&               column,
                                const std::string&               expected_type,
                                const UnknownColumn::ColumnList& available) {
  std::string message = "Could not read column '" + column + "' as " + expected_type + ". Available columns are ";
  if (available.empty()) {
    return message + "(none)";
  }
  bool first = true;
  for (const auto& [name, type] : available) {
    if (!first) message += ", ";
    first = false;
    message += "[" + name + ": " + type + "]";
  }
  return message;
}

} // namespace

UnknownColumn::UnknownColumn(std::string column, std::string expected_type, ColumnList available)
    : std::runtime_error(RenderUnknownColumn(column, expected_type, available)),
      column_(std::move(column)),
      expected_type_(std::move(expected_type)),
      available_(std::move(available)) {
}

} // namespace ducksql::util
