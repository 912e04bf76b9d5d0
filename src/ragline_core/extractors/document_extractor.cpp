#include "ragline_core/extractors/document_extractor.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include "ragline_core/errors.hpp"

namespace ragline_core {

std::string DocumentExtractor::get_string_content(const fs::path &file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentUnreadable("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentUnreadable("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string DocumentExtractor::compute_hash_from_content(const std::string &content) const {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw DocumentUnreadable("SHA-256 digest of document content failed");
  }

  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex << std::setw(2) << static_cast<unsigned>(digest[i]);
  }
  return hex.str();
}

Metadata DocumentExtractor::base_metadata(const fs::path &file_path,
                                          const std::string &content) const {
  return {{SOURCE_FIELD, file_path.string()},
          {CONTENT_HASH_FIELD, compute_hash_from_content(content)}};
}

}  // namespace ragline_core
