#include "CallbackDispatcher.hpp"
#include "TestHeaders.hpp"
#include "Transfer.hpp"
#include "TransferRateEstimator.hpp"

using namespace hl;
using std::chrono::milliseconds;

TEST_CASE("Rate settles after the minimum time", "[TransferRateEstimator]") {
  TransferRateEstimator estimator(1000, 0.5, milliseconds(2000), 3);
  auto start = TransferRateEstimator::Clock::now();

  estimator.update(100, start);
  REQUIRE_FALSE(estimator.getBytesPerSecond());
  REQUIRE_FALSE(estimator.getSecondsRemaining());

  estimator.update(100, start + milliseconds(1000));
  // One sample after one second is not enough yet
  REQUIRE_FALSE(estimator.getBytesPerSecond());

  estimator.update(300, start + milliseconds(2000));
  REQUIRE(estimator.getTransferred() == 500);
  REQUIRE(*estimator.getBytesPerSecond() == Approx(200.0));
  REQUIRE(*estimator.getSecondsRemaining() == Approx(2.5));

  estimator.update(500, start + milliseconds(3000));
  REQUIRE(*estimator.getSecondsRemaining() == 0.0);
}

TEST_CASE("Rate settles after enough samples", "[TransferRateEstimator]") {
  TransferRateEstimator estimator(0, 0.2, milliseconds(10000), 3);
  auto start = TransferRateEstimator::Clock::now();
  for (int a = 0; a < 3; a++) {
    estimator.update(10, start + milliseconds(100 * a));
    REQUIRE_FALSE(estimator.getBytesPerSecond());
  }
  estimator.update(10, start + milliseconds(300));
  REQUIRE(*estimator.getBytesPerSecond() == Approx(100.0));
  // Without a total there is nothing to count down to
  REQUIRE_FALSE(estimator.getSecondsRemaining());

  estimator.setTotal(100);
  REQUIRE(*estimator.getSecondsRemaining() == Approx(0.6));
}

TEST_CASE("Smoothing factor is checked", "[TransferRateEstimator]") {
  REQUIRE_THROWS(TransferRateEstimator(100, 0.0));
  REQUIRE_THROWS(TransferRateEstimator(100, 1.5));
  REQUIRE_NOTHROW(TransferRateEstimator(100, 1.0));
}

TEST_CASE("Folder state follows its files", "[FolderTransferAggregate]") {
  FolderTransferAggregate folder;
  REQUIRE(folder.getState() == TransferState::ACTIVE);

  size_t first = folder.addConstituent(100);
  size_t second = folder.addConstituent(50);
  folder.addProgress(first, 60);
  folder.addProgress(second, 10);
  REQUIRE(folder.getTotalSize() == 150);
  REQUIRE(folder.getTransferredBytes() == 70);

  SECTION("Every file completes") {
    folder.addProgress(first, 40);
    folder.finishConstituent(first, TransferState::COMPLETED);
    folder.addProgress(second, 40);
    folder.finishConstituent(second, TransferState::COMPLETED);
    // More files may still come
    REQUIRE(folder.getState() == TransferState::ACTIVE);
    folder.seal();
    REQUIRE(folder.getState() == TransferState::COMPLETED);
    REQUIRE(folder.getTransferredBytes() == 150);
  }

  SECTION("One file fails") {
    folder.finishConstituent(first, TransferState::COMPLETED);
    folder.finishConstituent(second, TransferState::FAILED);
    REQUIRE(folder.getState() == TransferState::FAILED);
    // Terminal constituents ignore late progress and state changes
    folder.addProgress(second, 40);
    folder.finishConstituent(second, TransferState::COMPLETED);
    REQUIRE(folder.getTransferredBytes() == 110);
    folder.seal();
    REQUIRE(folder.getState() == TransferState::FAILED);
  }

  SECTION("One file is cancelled") {
    folder.finishConstituent(second, TransferState::CANCELLED);
    REQUIRE(folder.getState() == TransferState::CANCELLED);
  }

  SECTION("Empty folder") {
    FolderTransferAggregate empty;
    empty.seal();
    REQUIRE(empty.getState() == TransferState::COMPLETED);
    REQUIRE(empty.size() == 0);
  }
}

TEST_CASE("Queued dispatcher runs tasks in order", "[CallbackDispatcher]") {
  QueuedDispatcher dispatcher;
  REQUIRE(dispatcher.runPending() == 0);
  REQUIRE(dispatcher.waitAndRunPending(milliseconds(10)) == 0);

  vector<int> order;
  std::thread poster([&dispatcher, &order] {
    for (int a = 0; a < 5; a++) {
      dispatcher.post([&order, a] { order.push_back(a); });
    }
  });
  poster.join();
  REQUIRE(dispatcher.pendingCount() == 5);
  // Nothing runs until the owner drains the queue
  REQUIRE(order.empty());
  REQUIRE(dispatcher.waitAndRunPending(milliseconds(1000)) == 5);
  REQUIRE(order == vector<int>({0, 1, 2, 3, 4}));
  REQUIRE(dispatcher.pendingCount() == 0);

  InlineDispatcher inlineDispatcher;
  inlineDispatcher.post([&order] { order.push_back(5); });
  REQUIRE(order.size() == 6);
}
