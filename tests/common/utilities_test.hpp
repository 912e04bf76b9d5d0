#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "ragline_core/index/vector_index.hpp"
#include "ragline_core/types/fragment.hpp"

namespace ragline_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Filesystem utilities
  static std::filesystem::path create_temp_dir(const std::string &prefix = "ragline_test");
  static void cleanup_temp_dir(const std::filesystem::path &dir);
  static std::filesystem::path write_file(const std::filesystem::path &path,
                                          const std::string &contents);

  // Test data creation
  static ragline_core::RawSegment make_segment(const std::string &text,
                                               const ragline_core::Metadata &metadata = {});

  // Unit vector along one axis.
  static std::vector<float> axis_vector(size_t dimension, size_t axis, float scale = 1.0f);

  static ragline_core::VectorIndexEntry make_entry(const std::vector<float> &embedding,
                                                   const std::string &text,
                                                   const ragline_core::Metadata &metadata = {});

  // Concatenates fragment texts after removing each fragment's overlap with the previous one.
  static std::string reconstruct(const std::vector<ragline_core::Fragment> &fragments,
                                 size_t chunk_overlap);
};

/**
 * Fixture owning a temporary directory that is removed after each test.
 */
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir();
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
};

}  // namespace ragline_tests
