#pragma once

#include <optional>

struct ButtonEdge
{
  bool green_pressed{false};
  bool red_pressed{false};
};

/**
 * @brief Rising-edge detection on the two-channel button input.
 *
 * Only the previous raw sample is retained. The first sample primes the
 * detector and never yields an edge.
 */
class ButtonEdgeDetector
{
public:
  ButtonEdge update(bool green, bool red);

  void reset();

private:
  struct Sample
  {
    bool green{false};
    bool red{false};
  };

  std::optional<Sample> previous_;
};
