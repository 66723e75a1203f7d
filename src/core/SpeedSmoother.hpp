#pragma once
#include <cstddef>
#include <deque>

// Linearly weighted moving average over the last kWindow speed readings.
// Newest sample weighs n, oldest weighs 1.
class SpeedSmoother {
public:
  static constexpr std::size_t kWindow = 5;

  // Negative readings count as 0. Returns the new smoothed value.
  double push(double speed_mps) {
    samples_.push_back(speed_mps > 0.0 ? speed_mps : 0.0);
    if (samples_.size() > kWindow)
      samples_.pop_front();
    return value();
  }

  double value() const {
    if (samples_.empty())
      return 0.0;
    double num = 0.0, den = 0.0;
    double w = 1.0;
    for (double s : samples_) {
      num += s * w;
      den += w;
      w += 1.0;
    }
    return num / den;
  }

  void reset() { samples_.clear(); }
  std::size_t size() const { return samples_.size(); }

private:
  std::deque<double> samples_;
};
