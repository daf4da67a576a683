#include <siteguard/core/association.hpp>
#include <cmath>
#include <limits>
#include <optional>

namespace siteguard::core {

namespace {

struct Candidate {
  std::size_t detection_index{0};
  float overlap{0.f};
};

float squared_distance(Point2f a, Point2f b) noexcept {
  const float dx = a.x - b.x;
  const float dy = a.y - b.y;
  return dx * dx + dy * dy;
}

/// True if candidate c should replace the current holder of a gear slot.
bool beats(const Candidate& c, const Candidate& holder,
           std::span<const Detection> detections) noexcept {
  const float c_conf = detections[c.detection_index].confidence;
  const float h_conf = detections[holder.detection_index].confidence;
  if (c_conf != h_conf) return c_conf > h_conf;
  if (c.overlap != holder.overlap) return c.overlap > holder.overlap;
  return c.detection_index < holder.detection_index;
}

}  // namespace

float overlap(const BBox& gear, const BBox& person, OverlapMetric metric) noexcept {
  switch (metric) {
    case OverlapMetric::Containment: {
      const float a = area(gear);
      if (a <= 0.f) return 0.f;
      return intersection_area(gear, person) / a;
    }
    case OverlapMetric::CenterPoint:
      return contains_point(person, center(gear)) ? 1.f : 0.f;
  }
  return 0.f;
}

AssociationResult associate(std::span<const Detection> detections,
                            const AssociationConfig& config) {
  AssociationResult result;

  std::vector<std::size_t> person_indices;
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (detections[i].label == ObjectLabel::Person) {
      person_indices.push_back(i);
    }
  }
  if (person_indices.empty()) {
    for (const auto& d : detections) {
      if (is_gear(d.label)) ++result.dropped_gear;
    }
    return result;
  }

  // winners[p][g]: best candidate of gear kind g for person p so far.
  std::vector<std::array<std::optional<Candidate>, kGearLabels.size()>> winners(
      person_indices.size());

  for (std::size_t i = 0; i < detections.size(); ++i) {
    const Detection& gear = detections[i];
    if (!is_gear(gear.label)) continue;

    const Point2f gear_center = center(gear.bbox);
    std::optional<std::size_t> best_person;
    float best_overlap = 0.f;
    float best_distance = std::numeric_limits<float>::max();

    for (std::size_t p = 0; p < person_indices.size(); ++p) {
      const BBox& person_box = detections[person_indices[p]].bbox;
      const float ov = overlap(gear.bbox, person_box, config.metric);
      if (!(ov > config.min_overlap) || ov <= 0.f) continue;

      const float dist = squared_distance(gear_center, center(person_box));
      // Persons are visited in index order, so strict comparisons keep the
      // lower index on a full tie.
      if (!best_person || ov > best_overlap ||
          (ov == best_overlap && dist < best_distance)) {
        best_person = p;
        best_overlap = ov;
        best_distance = dist;
      }
    }

    if (!best_person) {
      ++result.dropped_gear;
      continue;
    }

    const std::size_t slot = static_cast<std::size_t>(gear.label);
    auto& holder = winners[*best_person][slot];
    const Candidate c{i, best_overlap};
    if (!holder || beats(c, *holder, detections)) {
      holder = c;
    }
  }

  result.persons.reserve(person_indices.size());
  for (std::size_t p = 0; p < person_indices.size(); ++p) {
    PersonRecord record;
    record.index = person_indices[p];
    record.person = detections[person_indices[p]];
    for (const auto& w : winners[p]) {
      if (w) record.gear.set(detections[w->detection_index]);
    }
    result.persons.push_back(std::move(record));
  }
  return result;
}

}  // namespace siteguard::core
