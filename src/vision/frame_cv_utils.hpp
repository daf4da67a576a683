#pragma once

#include <siteguard/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace siteguard::vision::detail {

/// cv::Mat header over the frame's buffer (no copy). Returns nullopt if the
/// format has no Mat equivalent or the buffer is too small.
std::optional<cv::Mat> frame_to_mat(const siteguard::core::Frame& frame);

/// Writable view; drawing into it modifies the frame.
std::optional<cv::Mat> frame_to_mat(siteguard::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
siteguard::core::Frame mat_to_frame(const cv::Mat& mat,
                                    siteguard::core::PixelFormat format);

}  // namespace siteguard::vision::detail
