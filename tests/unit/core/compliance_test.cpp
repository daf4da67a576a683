#include <siteguard/core/association.hpp>
#include <siteguard/core/compliance.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace sc = siteguard::core;

namespace {

sc::GearSet gear_of(std::initializer_list<sc::Detection> items) {
  sc::GearSet g;
  for (const auto& d : items) g.set(d);
  return g;
}

const sc::Detection kHelmet{sc::ObjectLabel::Helmet, 0.9f, {}};
const sc::Detection kVest{sc::ObjectLabel::Vest, 0.8f, {}};
const sc::Detection kMask{sc::ObjectLabel::Mask, 0.7f, {}};

}  // namespace

TEST(Compliance, AllGearPresentIsCompliant) {
  const auto out = sc::evaluate(gear_of({kHelmet, kVest, kMask}), {});
  EXPECT_EQ(out.verdict, sc::ComplianceVerdict::Compliant);
  EXPECT_TRUE(out.missing.empty());
}

TEST(Compliance, MissingItemsInCanonicalOrder) {
  const auto out = sc::evaluate(gear_of({kVest}), {});
  EXPECT_EQ(out.verdict, sc::ComplianceVerdict::Violation);
  EXPECT_EQ(out.missing, (std::vector<sc::ObjectLabel>{sc::ObjectLabel::Helmet,
                                                       sc::ObjectLabel::Mask}));
}

TEST(Compliance, EmptyGearMissesEverything) {
  const auto out = sc::evaluate(sc::GearSet{}, {});
  EXPECT_EQ(out.verdict, sc::ComplianceVerdict::Violation);
  EXPECT_EQ(out.missing.size(), 3u);
}

TEST(Compliance, PolicySubset) {
  sc::CompliancePolicy policy;
  policy.required = {sc::ObjectLabel::Mask, sc::ObjectLabel::Helmet};
  auto out = sc::evaluate(gear_of({kHelmet, kMask}), policy);
  EXPECT_EQ(out.verdict, sc::ComplianceVerdict::Compliant);

  out = sc::evaluate(gear_of({kVest}), policy);
  EXPECT_EQ(out.missing, (std::vector<sc::ObjectLabel>{sc::ObjectLabel::Helmet,
                                                       sc::ObjectLabel::Mask}));
}

TEST(Compliance, EmptyPolicyIsAlwaysCompliant) {
  sc::CompliancePolicy policy;
  policy.required.clear();
  const auto out = sc::evaluate(sc::GearSet{}, policy);
  EXPECT_EQ(out.verdict, sc::ComplianceVerdict::Compliant);
}

TEST(Compliance, LowConfidenceGearCountsAsAbsent) {
  sc::CompliancePolicy policy;
  policy.min_confidence = 0.75f;
  const auto out = sc::evaluate(gear_of({kHelmet, kVest, kMask}), policy);
  EXPECT_EQ(out.verdict, sc::ComplianceVerdict::Violation);
  EXPECT_EQ(out.missing, (std::vector<sc::ObjectLabel>{sc::ObjectLabel::Mask}));
}

TEST(Compliance, EvaluationIsIdempotent) {
  const std::vector<sc::Detection> dets = {
      {sc::ObjectLabel::Person, 0.9f, {0.f, 0.f, 50.f, 100.f}},
      {sc::ObjectLabel::Helmet, 0.8f, {10.f, 0.f, 20.f, 15.f}},
      {sc::ObjectLabel::Person, 0.9f, {100.f, 0.f, 50.f, 100.f}},
      {sc::ObjectLabel::Vest, 0.8f, {105.f, 30.f, 40.f, 30.f}},
  };
  auto first = sc::associate(dets).persons;
  auto second = sc::associate(dets).persons;
  sc::evaluate_persons(first, {});
  sc::evaluate_persons(second, {});
  sc::evaluate_persons(second, {});
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].verdict, second[i].verdict);
    EXPECT_EQ(first[i].missing, second[i].missing);
  }
  EXPECT_EQ(first[0].missing, (std::vector<sc::ObjectLabel>{sc::ObjectLabel::Vest,
                                                            sc::ObjectLabel::Mask}));
  EXPECT_EQ(first[1].missing, (std::vector<sc::ObjectLabel>{sc::ObjectLabel::Helmet,
                                                            sc::ObjectLabel::Mask}));
}
