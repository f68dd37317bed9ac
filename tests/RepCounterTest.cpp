#include "RepCounter.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace {

// Feeds angles at a fixed frame spacing starting at t0; returns the time after the last frame.
int64_t feed(RepCounter& rc, const std::vector<float>& angles, int64_t t0, int64_t step,
             int* counted = nullptr) {
  int64_t t = t0;
  for (float a : angles) {
    RepEvent ev = rc.update(a, t);
    if (counted && ev.completed) (*counted)++;
    t += step;
  }
  return t;
}

const std::vector<float> kOneRep = {160, 150, 120, 95, 100, 140, 150, 160};

}  // namespace

TEST(RepCounterTest, OneFullExcursionIsOneRep) {
  RepCounter rc(110.0f, 145.0f, 150);
  int counted = 0;
  feed(rc, kOneRep, 0, 33, &counted);

  EXPECT_EQ(counted, 1);
  EXPECT_EQ(rc.total(), 1);
  EXPECT_EQ(rc.stage(), Stage::Up);
}

TEST(RepCounterTest, TransitionsAreReported) {
  RepCounter rc(110.0f, 145.0f, 150);

  RepEvent ev = rc.update(100.0f, 0);
  EXPECT_TRUE(ev.entered_down);
  EXPECT_FALSE(ev.completed);
  EXPECT_EQ(rc.stage(), Stage::Down);

  ev = rc.update(90.0f, 33);
  EXPECT_FALSE(ev.entered_down);   // already down

  ev = rc.update(150.0f, 66);
  EXPECT_TRUE(ev.entered_up);
  EXPECT_TRUE(ev.completed);
  EXPECT_EQ(ev.total_reps, 1);
}

TEST(RepCounterTest, NoiseInsideDeadZoneDoesNotDoubleCount) {
  RepCounter rc(110.0f, 145.0f, 0);
  int counted = 0;
  // go down once, then jitter between the thresholds, then come up once
  feed(rc, {160, 100, 115, 105, 140, 108, 130, 144, 112, 150, 130, 144, 120, 140}, 0, 33, &counted);

  EXPECT_EQ(counted, 1);
  EXPECT_EQ(rc.stage(), Stage::Up);
}

TEST(RepCounterTest, ShallowRepIsNotCounted) {
  RepCounter rc(110.0f, 145.0f, 0);
  int counted = 0;
  feed(rc, {160, 140, 115, 112, 130, 160}, 0, 33, &counted);
  EXPECT_EQ(counted, 0);
}

TEST(RepCounterTest, CooldownSuppressesCountButNotStage) {
  RepCounter rc(110.0f, 145.0f, 150);

  EXPECT_TRUE(rc.update(100.0f, 0).entered_down);
  EXPECT_TRUE(rc.update(150.0f, 10).completed);

  rc.update(100.0f, 20);
  RepEvent ev = rc.update(150.0f, 100);   // 90 ms after the last rep
  EXPECT_TRUE(ev.entered_up);
  EXPECT_FALSE(ev.completed);
  EXPECT_EQ(rc.stage(), Stage::Up);
  EXPECT_EQ(rc.total(), 1);

  rc.update(100.0f, 200);
  ev = rc.update(150.0f, 300);   // 290 ms after the last counted rep
  EXPECT_TRUE(ev.completed);
  EXPECT_EQ(rc.total(), 2);
}

TEST(RepCounterTest, CooldownIsStrict) {
  RepCounter rc(110.0f, 145.0f, 150);
  rc.update(100.0f, 0);
  rc.update(150.0f, 50);
  rc.update(100.0f, 100);
  EXPECT_FALSE(rc.update(150.0f, 200).completed);   // exactly 150 ms
  rc.update(100.0f, 250);
  EXPECT_TRUE(rc.update(150.0f, 251).completed);    // 201 ms
}

TEST(RepCounterTest, FirstRepIgnoresCooldown) {
  RepCounter rc(110.0f, 145.0f, 10000);
  rc.update(100.0f, 0);
  EXPECT_TRUE(rc.update(150.0f, 5).completed);
}

TEST(RepCounterTest, BackToBackSequencesWithinCooldown) {
  RepCounter rc(110.0f, 145.0f, 150);
  int counted = 0;

  // 10 ms frames: the second up-crossing lands 80 ms after the first
  int64_t t = feed(rc, kOneRep, 0, 10, &counted);
  feed(rc, kOneRep, t, 10, &counted);

  EXPECT_EQ(counted, 1);
  EXPECT_EQ(rc.stage(), Stage::Up);
}

TEST(RepCounterTest, BackToBackSequencesOutsideCooldown) {
  RepCounter rc(110.0f, 145.0f, 150);
  int counted = 0;

  // 33 ms frames: the second up-crossing lands 264 ms after the first
  int64_t t = feed(rc, kOneRep, 0, 33, &counted);
  feed(rc, kOneRep, t, 33, &counted);

  EXPECT_EQ(counted, 2);
}

TEST(RepCounterTest, ResetStageKeepsCount) {
  RepCounter rc(110.0f, 145.0f, 0);
  rc.update(100.0f, 0);
  rc.update(150.0f, 10);
  rc.update(100.0f, 20);
  ASSERT_EQ(rc.stage(), Stage::Down);

  rc.resetStage();
  EXPECT_EQ(rc.stage(), Stage::Up);
  EXPECT_EQ(rc.total(), 1);
  EXPECT_FALSE(rc.update(150.0f, 30).entered_up);
}

TEST(RepCounterTest, CooldownHoldsForNegativeTimestamps) {
  RepCounter rc(110.0f, 145.0f, 150);
  rc.update(100.0f, -1000);
  EXPECT_TRUE(rc.update(150.0f, -990).completed);

  rc.update(100.0f, -980);
  EXPECT_FALSE(rc.update(150.0f, -970).completed);   // 20 ms after the last rep
  EXPECT_EQ(rc.total(), 1);

  rc.update(100.0f, -900);
  EXPECT_TRUE(rc.update(150.0f, -800).completed);    // 190 ms
  EXPECT_EQ(rc.total(), 2);
}
