#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace islr::core {

/// Landmark layout produced by the upstream holistic detector.
/// Parts are stored in this order: pose, left hand, right hand, face mesh.
inline constexpr std::size_t kPosePoints = 33;
inline constexpr std::size_t kHandPoints = 21;
inline constexpr std::size_t kFacePoints = 468;
inline constexpr std::size_t kPointsPerFrame =
    kPosePoints + 2 * kHandPoints + kFacePoints;  // 543
inline constexpr std::size_t kCoordsPerPoint = 3;
inline constexpr std::size_t kFeatureDim = kPointsPerFrame * kCoordsPerPoint;  // 1629

/// Default gesture window (frames per recognition call).
inline constexpr std::size_t kDefaultWindowLength = 64;

enum class BodyPart : std::uint8_t {
  Pose,
  LeftHand,
  RightHand,
  Face,
};

/// Half-open point index range [first, first + count) of a body part.
struct PointRange {
  std::size_t first{0};
  std::size_t count{0};
};

[[nodiscard]] constexpr PointRange point_range(BodyPart part) noexcept {
  switch (part) {
    case BodyPart::Pose:
      return {0, kPosePoints};
    case BodyPart::LeftHand:
      return {kPosePoints, kHandPoints};
    case BodyPart::RightHand:
      return {kPosePoints + kHandPoints, kHandPoints};
    case BodyPart::Face:
      return {kPosePoints + 2 * kHandPoints, kFacePoints};
  }
  return {};
}

/// Normalized landmark coordinate; absent landmarks are all-zero.
struct Point3 {
  float x{0.f};
  float y{0.f};
  float z{0.f};
};

/// One timestep of landmarks. The point list is not validated on construction;
/// features::normalize_frame rejects frames that are not kPointsPerFrame long.
class KeypointFrame {
 public:
  KeypointFrame() = default;

  KeypointFrame(std::uint64_t frame_id, std::vector<Point3> points)
      : frame_id_(frame_id), points_(std::move(points)) {}

  /// Frame with every part absent (all-zero points).
  [[nodiscard]] static KeypointFrame absent(std::uint64_t frame_id) {
    return KeypointFrame(frame_id, std::vector<Point3>(kPointsPerFrame));
  }

  [[nodiscard]] std::uint64_t frame_id() const noexcept { return frame_id_; }
  [[nodiscard]] std::span<const Point3> points() const noexcept { return points_; }
  [[nodiscard]] std::span<Point3> points() noexcept { return points_; }
  [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }

  /// Points of a single part; empty span if the frame is malformed.
  [[nodiscard]] std::span<const Point3> part(BodyPart p) const noexcept {
    const PointRange r = point_range(p);
    if (points_.size() < r.first + r.count) return {};
    return std::span<const Point3>(points_).subspan(r.first, r.count);
  }

 private:
  std::uint64_t frame_id_{0};
  std::vector<Point3> points_;
};

/// Frames of one gesture, possibly out of temporal order.
using KeypointSequence = std::vector<KeypointFrame>;

}  // namespace islr::core
