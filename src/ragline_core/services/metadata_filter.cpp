#include "ragline_core/services/metadata_filter.hpp"

#include <cstdlib>
#include <optional>

#include "ragline_core/errors.hpp"

namespace ragline_core {

namespace {

std::optional<double> parse_number(const std::string &value) {
  if (value.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double number = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size()) {
    return std::nullopt;
  }
  return number;
}

}  // namespace

MetadataFilter &MetadataFilter::where_equals(const std::string &field, const std::string &value) {
  terms_.push_back({field, value});
  return *this;
}

MetadataFilter &MetadataFilter::where_between(const std::string &field,
                                              double min_value,
                                              double max_value) {
  if (min_value > max_value) {
    throw InvalidConfiguration("Range filter on '" + field + "' has min greater than max");
  }
  ranges_.push_back({field, min_value, max_value});
  return *this;
}

bool MetadataFilter::matches(const Metadata &metadata) const {
  for (const auto &term : terms_) {
    auto it = metadata.find(term.field);
    if (it == metadata.end() || it->second != term.value) {
      return false;
    }
  }
  for (const auto &range : ranges_) {
    auto it = metadata.find(range.field);
    if (it == metadata.end()) {
      return false;
    }
    std::optional<double> number = parse_number(it->second);
    if (!number || *number < range.min_value || *number > range.max_value) {
      return false;
    }
  }
  return true;
}

}  // namespace ragline_core
