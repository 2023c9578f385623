#ifndef __HL_TRANSFER_RATE_ESTIMATOR__
#define __HL_TRANSFER_RATE_ESTIMATOR__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Smoothed throughput and time remaining of one transfer.
 *
 * The rate is an exponential moving average of the per sample rates,
 * seeded with the first one.  Nothing is reported until the transfer has
 * run for `minElapsed` or produced `minSamples` samples.
 */
class TransferRateEstimator {
 public:
  typedef std::chrono::steady_clock Clock;

  explicit TransferRateEstimator(uint64_t _total = 0, double _alpha = 0.2,
                                 std::chrono::milliseconds _minElapsed =
                                     std::chrono::milliseconds(2000),
                                 int _minSamples = 8);

  void update(uint64_t bytes) { update(bytes, Clock::now()); }
  void update(uint64_t bytes, Clock::time_point now);

  inline void setTotal(uint64_t _total) { total = _total; }
  inline uint64_t getTransferred() const { return transferred; }

  /** @brief Bytes per second, once the estimate can be trusted. */
  optional<double> getBytesPerSecond() const;
  /** @brief Seconds until `total` is reached at the current rate. */
  optional<double> getSecondsRemaining() const;

 protected:
  uint64_t total;
  double alpha;
  std::chrono::milliseconds minElapsed;
  int minSamples;

  uint64_t transferred;
  double emaBytesPerSecond;
  int sampleCount;
  optional<Clock::time_point> startTime;
  optional<Clock::time_point> lastUpdateTime;
  Clock::time_point latestTime;
};
}  // namespace hl

#endif  // __HL_TRANSFER_RATE_ESTIMATOR__
