#include <siteguard/core/detection.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace siteguard::core {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

std::string_view label_name(ObjectLabel label) noexcept {
  switch (label) {
    case ObjectLabel::Helmet:
      return "Helmet";
    case ObjectLabel::Vest:
      return "Vest";
    case ObjectLabel::Mask:
      return "Mask";
    case ObjectLabel::Person:
      return "Person";
  }
  return "Unknown";
}

std::optional<ObjectLabel> parse_object_label(std::string_view name) {
  const std::string n = lower(name);
  if (n == "helmet" || n == "hardhat") return ObjectLabel::Helmet;
  if (n == "vest" || n == "safety vest") return ObjectLabel::Vest;
  if (n == "mask") return ObjectLabel::Mask;
  if (n == "person") return ObjectLabel::Person;
  return std::nullopt;
}

float area(const BBox& b) noexcept {
  if (b.w <= 0.f || b.h <= 0.f) return 0.f;
  return b.w * b.h;
}

float intersection_area(const BBox& a, const BBox& b) noexcept {
  const float ix = std::min(a.right(), b.right()) - std::max(a.x, b.x);
  const float iy = std::min(a.bottom(), b.bottom()) - std::max(a.y, b.y);
  if (ix <= 0.f || iy <= 0.f) return 0.f;
  return ix * iy;
}

float iou(const BBox& a, const BBox& b) noexcept {
  const float inter = intersection_area(a, b);
  const float uni = area(a) + area(b) - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

Point2f center(const BBox& b) noexcept {
  return {b.x + b.w * 0.5f, b.y + b.h * 0.5f};
}

bool contains_point(const BBox& b, Point2f p) noexcept {
  return p.x >= b.x && p.x < b.right() && p.y >= b.y && p.y < b.bottom();
}

BBox clamp_to(const BBox& b, float width, float height) noexcept {
  const float x1 = std::clamp(b.x, 0.f, width);
  const float y1 = std::clamp(b.y, 0.f, height);
  const float x2 = std::clamp(b.right(), 0.f, width);
  const float y2 = std::clamp(b.bottom(), 0.f, height);
  return {x1, y1, std::max(0.f, x2 - x1), std::max(0.f, y2 - y1)};
}

}  // namespace siteguard::core
