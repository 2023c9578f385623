#include "TransferRateEstimator.hpp"

namespace hl {
TransferRateEstimator::TransferRateEstimator(
    uint64_t _total, double _alpha, std::chrono::milliseconds _minElapsed,
    int _minSamples)
    : total(_total),
      alpha(_alpha),
      minElapsed(_minElapsed),
      minSamples(_minSamples),
      transferred(0),
      emaBytesPerSecond(0),
      sampleCount(0) {
  if (alpha <= 0 || alpha > 1) {
    throw std::runtime_error("Smoothing factor must be in (0, 1]");
  }
}

void TransferRateEstimator::update(uint64_t bytes, Clock::time_point now) {
  if (!startTime) {
    startTime = now;
  }
  double seconds = 0;
  if (lastUpdateTime) {
    seconds = std::chrono::duration<double>(now - *lastUpdateTime).count();
  }
  lastUpdateTime = now;
  latestTime = now;
  transferred += bytes;

  if (seconds > 0) {
    double instantRate = double(bytes) / seconds;
    sampleCount++;
    if (emaBytesPerSecond == 0) {
      emaBytesPerSecond = instantRate;
    } else {
      emaBytesPerSecond += alpha * (instantRate - emaBytesPerSecond);
    }
  }
}

optional<double> TransferRateEstimator::getBytesPerSecond() const {
  if (!startTime || emaBytesPerSecond <= 0) {
    return nullopt;
  }
  bool longEnough = (latestTime - *startTime) >= minElapsed;
  if (!longEnough && sampleCount < minSamples) {
    return nullopt;
  }
  return emaBytesPerSecond;
}

optional<double> TransferRateEstimator::getSecondsRemaining() const {
  auto speed = getBytesPerSecond();
  if (!speed || total == 0) {
    return nullopt;
  }
  if (transferred >= total) {
    return 0.0;
  }
  return double(total - transferred) / *speed;
}
}  // namespace hl
