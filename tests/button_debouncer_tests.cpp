#include <catch2/catch.hpp>

#include "src/domain/ButtonDebouncer.h"

namespace button_debouncer {

struct TestSubject {
  ButtonDebouncer keys;
  int shutter = keys.addKey(Button::CaptureShort, false);
  int left = keys.addKey(Button::Left, false);
  int select = keys.addKey(Button::Select, false);

  // Holds every key at the given level for `ms`, sampling each 10 ms.
  void hold(bool shutterDown, bool leftDown, bool selectDown, uint32_t& now, uint32_t ms) {
    for (uint32_t end = now + ms; now < end; now += 10) {
      keys.sample(shutter, shutterDown, now);
      keys.sample(left, leftDown, now);
      keys.sample(select, selectDown, now);
    }
  }
};

TEST_CASE("Presses completing in the same pass are all delivered", "[buttons]") {
  TestSubject t;
  uint32_t now = 1000;
  t.hold(false, true, true, now, 100);

  CHECK(t.keys.pending() == 2);
  CHECK(t.keys.next() == Button::Left);
  CHECK(t.keys.next() == Button::Select);
  CHECK(t.keys.next() == Button::None);
}

TEST_CASE("Bounces shorter than the debounce time are ignored", "[buttons]") {
  TestSubject t;
  uint32_t now = 0;
  for (int i = 0; i < 6; ++i) {
    t.keys.sample(t.left, i % 2 == 0, now);
    now += 5;
  }
  CHECK(t.keys.next() == Button::None);
}

TEST_CASE("The shutter reports short on release and long once while held", "[buttons]") {
  TestSubject t;
  uint32_t now = 0;

  SECTION("short press") {
    t.hold(true, false, false, now, 200);
    CHECK(t.keys.next() == Button::None);
    t.hold(false, false, false, now, 100);
    CHECK(t.keys.next() == Button::CaptureShort);
  }
  SECTION("long press") {
    t.hold(true, false, false, now, ButtonDebouncer::kLongPressMs + 200);
    CHECK(t.keys.next() == Button::CaptureLong);
    t.hold(false, false, false, now, 100);
    CHECK(t.keys.next() == Button::None);
  }
}

TEST_CASE("A key held at startup counts only after release", "[buttons]") {
  ButtonDebouncer keys;
  const int select = keys.addKey(Button::Select, true);
  uint32_t now = 0;
  for (; now < 200; now += 10) keys.sample(select, true, now);
  CHECK(keys.next() == Button::None);
  for (; now < 300; now += 10) keys.sample(select, false, now);
  for (; now < 400; now += 10) keys.sample(select, true, now);
  CHECK(keys.next() == Button::Select);
}

TEST_CASE("A full queue keeps the oldest presses", "[buttons]") {
  ButtonDebouncer keys;
  const int left = keys.addKey(Button::Left, false);
  uint32_t now = 0;
  for (size_t press = 0; press < ButtonDebouncer::kQueueDepth + 2; ++press) {
    for (int i = 0; i < 5; ++i, now += 10) keys.sample(left, true, now);
    for (int i = 0; i < 5; ++i, now += 10) keys.sample(left, false, now);
  }
  CHECK(keys.pending() == ButtonDebouncer::kQueueDepth);

  for (int i = 0; i < ButtonDebouncer::kMaxKeys; ++i) keys.addKey(Button::Up, false);
  CHECK(keys.addKey(Button::Down, false) == -1);
}

}  // namespace button_debouncer
