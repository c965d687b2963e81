#include "delivery_controller/button_edge_detector.hpp"

ButtonEdge ButtonEdgeDetector::update(bool green, bool red)
{
  ButtonEdge edge;

  if (previous_) {
    edge.green_pressed = green && !previous_->green;
    edge.red_pressed = red && !previous_->red;
  }

  previous_ = Sample{green, red};
  return edge;
}

void ButtonEdgeDetector::reset()
{
  previous_.reset();
}
