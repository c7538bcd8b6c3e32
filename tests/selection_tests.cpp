#include <catch2/catch.hpp>

#include "src/domain/PromptSelector.h"
#include "src/domain/QualityManager.h"
#include "src/domain/SelectionCycle.h"

namespace selection {

std::vector<QualityMode> fourModes() {
  std::vector<QualityMode> modes;
  const char* ids[] = {"LOW", "MEDIUM", "HIGH", "ULTRA"};
  for (int i = 0; i < 4; ++i) {
    QualityMode m;
    m.id = ids[i];
    m.label = ids[i];
    m.resolutionCode = 8 + i;
    m.targetBytes = (i + 1) * 100 * 1024;
    m.maxBytes = (i + 1) * 400 * 1024;
    modes.push_back(m);
  }
  return modes;
}

std::vector<PromptMode> threePrompts() {
  std::vector<PromptMode> prompts;
  const char* labels[] = {"Describe", "Read Text", "Haiku"};
  for (int i = 0; i < 3; ++i) {
    PromptMode p;
    p.id = labels[i];
    p.label = labels[i];
    p.instruction = std::string("Do ") + labels[i];
    prompts.push_back(p);
  }
  return prompts;
}

TEST_CASE("SelectionCycle wraps at both ends", "[selection]") {
  CHECK(SelectionCycle::step(0, 4, 1) == 1);
  CHECK(SelectionCycle::step(3, 4, 1) == 0);
  CHECK(SelectionCycle::step(0, 4, -1) == 3);
  CHECK(SelectionCycle::step(2, 4, -5) == 1);  // sign only
  CHECK(SelectionCycle::step(2, 4, 0) == 2);
  CHECK(SelectionCycle::step(0, 0, 1) == 0);
  CHECK(SelectionCycle::step(0, 1, 1) == 0);
}

TEST_CASE("QualityManager cycling returns to the start after a full lap", "[selection][quality]") {
  const std::vector<QualityMode> modes = fourModes();
  for (size_t start = 0; start < modes.size(); ++start) {
    QualityManager qm(modes, 2 * 1024 * 1024, start);
    for (size_t i = 0; i < modes.size(); ++i) {
      qm.cycle(1);
      REQUIRE(qm.index() < modes.size());
    }
    CHECK(qm.index() == start);
    for (size_t i = 0; i < modes.size(); ++i) {
      qm.cycle(-1);
      REQUIRE(qm.index() < modes.size());
    }
    CHECK(qm.index() == start);
  }
}

TEST_CASE("QualityManager exposes the active mode", "[selection][quality]") {
  const std::vector<QualityMode> modes = fourModes();
  QualityManager qm(modes, 2 * 1024 * 1024, 1);
  CHECK(qm.current().id == "MEDIUM");
  CHECK(qm.label() == "MEDIUM");
  qm.cycle(-1);
  qm.cycle(-1);
  CHECK(qm.current().id == "ULTRA");
  CHECK_FALSE(qm.select(4));
  CHECK(qm.current().id == "ULTRA");
}

TEST_CASE("QualityManager ceiling is global, not per mode", "[selection][quality]") {
  const std::vector<QualityMode> modes = fourModes();
  const size_t ceiling = 2 * 1024 * 1024;
  QualityManager qm(modes, ceiling);

  for (size_t m = 0; m < modes.size(); ++m) {
    REQUIRE(qm.select(m));
    CHECK(qm.validate(0) == SizeVerdict::Ok);
    CHECK(qm.validate(ceiling) == SizeVerdict::Ok);
    CHECK(qm.validate(ceiling + 1) == SizeVerdict::Oversized);
    CHECK(qm.validate(ceiling * 4) == SizeVerdict::Oversized);
  }

  SECTION("mode maximum is only reported") {
    REQUIRE(qm.select(0));  // LOW, 400KB max
    CHECK(qm.exceedsModeBudget(500 * 1024));
    CHECK(qm.validate(500 * 1024) == SizeVerdict::Ok);
    CHECK_FALSE(qm.exceedsModeBudget(400 * 1024));
  }
}

TEST_CASE("PromptSelector wraps in both directions", "[selection][prompt]") {
  const std::vector<PromptMode> prompts = threePrompts();
  PromptSelector ps(prompts);
  CHECK(ps.current().label == "Describe");
  ps.cycle(-1);
  CHECK(ps.current().label == "Haiku");
  ps.cycle(1);
  ps.cycle(1);
  CHECK(ps.current().label == "Read Text");

  for (int i = 0; i < 3; ++i) ps.cycle(1);
  CHECK(ps.index() == 1);

  CHECK_FALSE(ps.select(7));
  CHECK(ps.index() == 1);
}

TEST_CASE("Out of range initial index falls back to the first entry", "[selection]") {
  const std::vector<PromptMode> prompts = threePrompts();
  PromptSelector ps(prompts, 9);
  CHECK(ps.index() == 0);
}

}  // namespace selection
