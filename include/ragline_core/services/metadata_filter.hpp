#pragma once

#include <string>
#include <vector>

#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

/**
 * @brief Conjunction of predicates over a fragment's source metadata.
 *
 * Exact terms compare strings. Ranges parse the field as a number and are
 * inclusive on both ends; a missing or non-numeric field fails the range.
 * An empty filter matches everything.
 */
class MetadataFilter {
 public:
  struct Term {
    std::string field;
    std::string value;
  };

  struct Range {
    std::string field;
    double min_value;
    double max_value;
  };

  MetadataFilter &where_equals(const std::string &field, const std::string &value);
  MetadataFilter &where_between(const std::string &field, double min_value, double max_value);

  bool matches(const Metadata &metadata) const;
  bool empty() const {
    return terms_.empty() && ranges_.empty();
  }

  const std::vector<Term> &terms() const {
    return terms_;
  }
  const std::vector<Range> &ranges() const {
    return ranges_;
  }

 private:
  std::vector<Term> terms_;
  std::vector<Range> ranges_;
};

}  // namespace ragline_core
