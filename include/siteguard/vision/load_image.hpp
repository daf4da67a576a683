#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace siteguard::vision {

/// Load an image file into a BGR8 Frame. LoadFailed if unreadable.
[[nodiscard]] std::expected<siteguard::core::Frame, siteguard::core::PipelineError>
load_frame_from_image(const std::string& path);

/// Decode an in-memory image (JPEG, PNG, ...) into a BGR8 Frame.
/// InvalidFrame if the bytes are not a decodable image.
[[nodiscard]] std::expected<siteguard::core::Frame, siteguard::core::PipelineError>
decode_frame(std::span<const std::byte> encoded);

/// Encode an 8-bit frame as JPEG.
[[nodiscard]] std::expected<std::vector<std::byte>, siteguard::core::PipelineError>
encode_jpeg(const siteguard::core::Frame& frame, int quality = 85);

/// Write a frame to disk; the format follows the file extension.
[[nodiscard]] std::expected<void, siteguard::core::PipelineError>
save_frame(const siteguard::core::Frame& frame, const std::string& path);

}  // namespace siteguard::vision
