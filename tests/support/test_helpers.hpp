#pragma once

#include <islr/core/keypoint_frame.hpp>
#include <islr/model/model_config.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace islr::test {

/// Frame whose every coordinate equals value.
inline islr::core::KeypointFrame make_frame(std::uint64_t id, float value = 0.f) {
  return islr::core::KeypointFrame(
      id, std::vector<islr::core::Point3>(islr::core::kPointsPerFrame, {value, value, value}));
}

/// n all-zero frames with ids first_id, first_id + 1, ...
inline islr::core::KeypointSequence make_sequence(std::size_t n, std::uint64_t first_id = 0) {
  islr::core::KeypointSequence seq;
  for (std::size_t i = 0; i < n; ++i) {
    seq.push_back(islr::core::KeypointFrame::absent(first_id + i));
  }
  return seq;
}

/// Small architecture for fast tests.
inline islr::model::ModelConfig tiny_config(std::size_t num_classes,
                                            std::size_t input_dim = islr::core::kFeatureDim) {
  islr::model::ModelConfig c;
  c.input_dim = input_dim;
  c.hidden_dim = 8;
  c.num_layers = 1;
  c.num_classes = num_classes;
  c.dropout = 0.f;
  c.seed = 7;
  return c;
}

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "islr_test_";
    if (info != nullptr) name += std::string(info->name()) + "_";
    name += std::to_string(rd());
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
  [[nodiscard]] std::string file(const std::string& name) const { return (path_ / name).string(); }

 private:
  std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path& path, const std::string& text) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream f(path);
  f << text;
}

}  // namespace islr::test
