#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ragline_core/services/compression_service.hpp"

namespace ragline_tests {

using ragline_core::CompressionError;
using ragline_core::CompressionService;

TEST(CompressionServiceTest, FragmentTextSurvivesCompression) {
  const std::string text =
      "name: Alice\nrole: engineer\ncompany: Acme\n\xc3\xa9t\xc3\xa9 \xe2\x82\xac 42";
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text)), text);
}

TEST(CompressionServiceTest, RepetitiveTextShrinks) {
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "Alice is an engineer at Acme. ";
  }
  std::vector<char> compressed = CompressionService::compress(text);
  EXPECT_LT(compressed.size(), text.size() / 10);
  EXPECT_EQ(CompressionService::decompress(compressed), text);
}

TEST(CompressionServiceTest, EmptyTextIsEmptyBuffer) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST(CompressionServiceTest, EmbeddedNulBytesArePreserved) {
  const std::string text("a\0b\0c", 5);
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text)), text);
}

TEST(CompressionServiceTest, RejectsOutOfRangeLevel) {
  EXPECT_THROW(CompressionService::compress("text", 1000), CompressionError);
}

TEST(CompressionServiceTest, RejectsDataThatIsNotZstd) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), CompressionError);
}

TEST(CompressionServiceTest, RejectsTruncatedFrame) {
  std::vector<char> compressed =
      CompressionService::compress(std::string(4096, 'x') + "tail that differs");
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(CompressionService::decompress(compressed), CompressionError);
}

}  // namespace ragline_tests
