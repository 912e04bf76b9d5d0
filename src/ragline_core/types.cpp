#include "ragline_core/types.hpp"

namespace ragline_core {

std::string to_string(DocumentType type) {
  switch (type) {
    case DocumentType::Text:
      return "Text";
    case DocumentType::Csv:
      return "Csv";
    default:
      return "Unknown";
  }
}

}  // namespace ragline_core
