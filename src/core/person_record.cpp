#include <siteguard/core/person_record.hpp>
#include <stdexcept>

namespace siteguard::core {

std::size_t GearSet::slot(ObjectLabel kind) {
  switch (kind) {
    case ObjectLabel::Helmet:
      return 0;
    case ObjectLabel::Vest:
      return 1;
    case ObjectLabel::Mask:
      return 2;
    case ObjectLabel::Person:
      break;
  }
  throw std::invalid_argument("GearSet: Person is not a gear kind");
}

std::size_t GearSet::size() const noexcept {
  std::size_t n = 0;
  for (const auto& s : slots_) {
    if (s) ++n;
  }
  return n;
}

std::vector<Detection> GearSet::items() const {
  std::vector<Detection> out;
  out.reserve(slots_.size());
  for (const auto& s : slots_) {
    if (s) out.push_back(*s);
  }
  return out;
}

}  // namespace siteguard::core
