#pragma once

#include <string>

namespace ragline_core {

enum class DocumentType { Text, Csv, Unknown };

std::string to_string(DocumentType type);

}  // namespace ragline_core
