#include "delivery_controller/feedback_pattern.hpp"

#include <vector>

#include <gtest/gtest.h>

TEST(FeedbackPattern, ErrorAlternatesRedAndOff)
{
  FeedbackTicker ticker(1);
  IndicatorFrame previous;

  for (int cycle = 0; cycle < 8; ++cycle) {
    ASSERT_TRUE(ticker.advance());
    const IndicatorFrame frame = computeIndicators(RobotState::Error, ticker.phase());

    // exactly one led lit, always red
    EXPECT_NE(frame.led1 == LedColor::Red, frame.led2 == LedColor::Red);
    EXPECT_TRUE(frame.led1 == LedColor::Off || frame.led2 == LedColor::Off);

    if (cycle > 0) {
      EXPECT_EQ(frame.led1, previous.led2);
      EXPECT_EQ(frame.led2, previous.led1);
    }
    previous = frame;
  }
}

TEST(FeedbackPattern, NonErrorAlternatesGreenAndOff)
{
  const std::vector<RobotState> states{
    RobotState::Initialization, RobotState::GotoPickup, RobotState::AtPickup,
    RobotState::GotoDropoff, RobotState::AtDropoff};

  for (const auto state : states) {
    const IndicatorFrame phase1 = computeIndicators(state, 1);
    const IndicatorFrame phase2 = computeIndicators(state, 2);

    EXPECT_EQ(phase1.led1, LedColor::Off);
    EXPECT_EQ(phase1.led2, LedColor::Green);
    EXPECT_EQ(phase2.led1, LedColor::Green);
    EXPECT_EQ(phase2.led2, LedColor::Off);
  }
}

TEST(FeedbackPattern, ErrorBitSelectsRed)
{
  const IndicatorFrame frame = computeIndicators(true, 2);
  EXPECT_EQ(frame.led1, LedColor::Red);
  EXPECT_EQ(frame.led2, LedColor::Off);
}

TEST(FeedbackTicker, EmitsEveryDividerTicksStartingOnFourth)
{
  FeedbackTicker ticker(5);

  std::vector<int> emitted;
  for (int tick = 1; tick <= 14; ++tick) {
    if (ticker.advance()) {
      emitted.push_back(tick);
    }
  }

  EXPECT_EQ(emitted, (std::vector<int>{4, 9, 14}));
}

TEST(FeedbackTicker, PhaseStartsAtOneAndAlternates)
{
  FeedbackTicker ticker(2);

  std::vector<unsigned> phases;
  for (int tick = 0; tick < 8; ++tick) {
    if (ticker.advance()) {
      phases.push_back(ticker.phase());
    }
  }

  ASSERT_EQ(phases.size(), 4u);
  EXPECT_EQ(phases, (std::vector<unsigned>{1, 2, 1, 2}));
}

TEST(FeedbackPattern, FormatsOrderProgress)
{
  const std::string nav = formatNavigationProgress(2.5, "moving");
  EXPECT_EQ(nav, "Distance : 2.5, Message : moving");
  EXPECT_EQ(formatOrderProgress(RobotState::GotoDropoff, nav),
            "Status : GOTO_DROPOFF  [Distance : 2.5, Message : moving]");
}
