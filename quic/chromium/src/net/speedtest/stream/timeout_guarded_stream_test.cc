#include "net/speedtest/stream/timeout_guarded_stream.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "net/speedtest/test_tools/fake_chunk_stream.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_test.h"
#include "net/third_party/quiche/src/quic/test_tools/mock_clock.h"
#include "net/third_party/quiche/src/quic/test_tools/quic_test_utils.h"

using quic::QuicTime;

namespace speedtest {
namespace test {

class TimeoutGuardedStreamPeer {
 public:
  static quic::QuicAlarm* GetAlarm(TimeoutGuardedStream* stream) {
    return stream->alarm_.get();
  }
};

namespace {

const int64_t kTimeoutSecs = 20;

class CountingDelegate : public TimeoutGuardedStream::Delegate {
 public:
  CountingDelegate() : calls(0) {}
  void OnDeadlineExpired() override { ++calls; }

  int calls;
};

class TimeoutGuardedStreamTest : public quic::QuicTest {
 protected:
  TimeoutGuardedStreamTest() : chunks_(MakeChunks(5, 100))
    , destroyed_(false)
    , inner_(nullptr) {
    clock_.AdvanceTime(QuicTime::Delta::FromSeconds(1000));
  }

  std::unique_ptr<TimeoutGuardedStream> MakeGuard() {
    std::unique_ptr<FakeChunkStream> inner =
        std::make_unique<FakeChunkStream>(chunks_, &destroyed_);
    inner_ = inner.get();
    return std::make_unique<TimeoutGuardedStream>(
        std::move(inner), QuicTime::Delta::FromSeconds(kTimeoutSecs), &clock_,
        &alarm_factory_, &delegate_);
  }

  // Stands in for the event loop: fires the alarm if it is due.
  void RunDueAlarm(TimeoutGuardedStream* guard) {
    quic::QuicAlarm* alarm = TimeoutGuardedStreamPeer::GetAlarm(guard);
    if (alarm->IsSet() && alarm->deadline() <= clock_.Now()) {
      alarm_factory_.FireAlarm(alarm);
    }
  }

  void Wait(TimeoutGuardedStream* guard, QuicTime::Delta delta) {
    clock_.AdvanceTime(delta);
    RunDueAlarm(guard);
  }

  quic::MockClock clock_;
  quic::test::MockAlarmFactory alarm_factory_;
  CountingDelegate delegate_;
  std::vector<std::string> chunks_;
  bool destroyed_;
  // Owned by the guard, valid until `destroyed_` is set.
  FakeChunkStream* inner_;
};

TEST_F(TimeoutGuardedStreamTest, PassesChunksThroughWhenConsumedInTime) {
  std::unique_ptr<TimeoutGuardedStream> guard = MakeGuard();

  std::vector<std::string> received;
  std::string chunk;
  for (size_t i = 0; i < chunks_.size(); ++i) {
    Wait(guard.get(), QuicTime::Delta::FromSeconds(kTimeoutSecs - 1));
    ASSERT_TRUE(guard->Next(&chunk)) << "chunk " << i;
    received.push_back(chunk);
  }
  Wait(guard.get(), QuicTime::Delta::FromSeconds(kTimeoutSecs - 1));
  EXPECT_FALSE(guard->Next(&chunk));

  EXPECT_EQ(chunks_, received);
  EXPECT_FALSE(guard->expired());
  EXPECT_EQ(0, delegate_.calls);
  EXPECT_TRUE(destroyed_);
  EXPECT_FALSE(TimeoutGuardedStreamPeer::GetAlarm(guard.get())->IsSet());
}

TEST_F(TimeoutGuardedStreamTest, DeadlineResetsAfterEveryChunk) {
  std::unique_ptr<TimeoutGuardedStream> guard = MakeGuard();
  std::string chunk;

  ASSERT_TRUE(guard->Next(&chunk));
  EXPECT_EQ(clock_.Now() + QuicTime::Delta::FromSeconds(kTimeoutSecs),
            guard->deadline());

  clock_.AdvanceTime(QuicTime::Delta::FromSeconds(7));
  ASSERT_TRUE(guard->Next(&chunk));
  EXPECT_EQ(clock_.Now() + QuicTime::Delta::FromSeconds(kTimeoutSecs),
            guard->deadline());
}

TEST_F(TimeoutGuardedStreamTest, StallEndsStreamAfterDeliveredChunks) {
  std::unique_ptr<TimeoutGuardedStream> guard = MakeGuard();
  std::string chunk;

  // The consumer takes chunks 1 and 2 in time and stalls on chunk 3.
  ASSERT_TRUE(guard->Next(&chunk));
  Wait(guard.get(), QuicTime::Delta::FromSeconds(5));
  ASSERT_TRUE(guard->Next(&chunk));
  EXPECT_EQ(2u, inner_->pulled());
  Wait(guard.get(), QuicTime::Delta::FromSeconds(kTimeoutSecs + 1));

  EXPECT_TRUE(guard->expired());
  EXPECT_EQ(1, delegate_.calls);
  EXPECT_TRUE(destroyed_);

  EXPECT_FALSE(guard->Next(&chunk));
  EXPECT_FALSE(guard->Next(&chunk));
  EXPECT_EQ(1, delegate_.calls);
}

TEST_F(TimeoutGuardedStreamTest, LateConsumerSeesEndWithoutAlarm) {
  std::unique_ptr<TimeoutGuardedStream> guard = MakeGuard();
  std::string chunk;

  ASSERT_TRUE(guard->Next(&chunk));
  // The event loop has not run the alarm yet.
  clock_.AdvanceTime(QuicTime::Delta::FromSeconds(kTimeoutSecs));
  EXPECT_FALSE(guard->Next(&chunk));
  EXPECT_TRUE(guard->expired());
  EXPECT_TRUE(destroyed_);
  // Only the alarm path notifies the delegate.
  EXPECT_EQ(0, delegate_.calls);
}

TEST_F(TimeoutGuardedStreamTest, EarlyAlarmRearmsForRealDeadline) {
  std::unique_ptr<TimeoutGuardedStream> guard = MakeGuard();
  std::string chunk;

  // A chunk shortly after start moves the deadline by less than the alarm
  // granularity, so the alarm still points at the original deadline.
  clock_.AdvanceTime(QuicTime::Delta::FromMilliseconds(500));
  ASSERT_TRUE(guard->Next(&chunk));
  QuicTime deadline = guard->deadline();

  Wait(guard.get(), QuicTime::Delta::FromMilliseconds(kTimeoutSecs * 1000 -
                                                      100));
  EXPECT_FALSE(guard->expired());
  quic::QuicAlarm* alarm = TimeoutGuardedStreamPeer::GetAlarm(guard.get());
  EXPECT_TRUE(alarm->IsSet());
  EXPECT_EQ(deadline, alarm->deadline());

  Wait(guard.get(), QuicTime::Delta::FromMilliseconds(100));
  EXPECT_TRUE(guard->expired());
  EXPECT_EQ(1, delegate_.calls);
}

TEST_F(TimeoutGuardedStreamTest, DestructionReleasesStream) {
  std::unique_ptr<TimeoutGuardedStream> guard = MakeGuard();
  std::string chunk;
  ASSERT_TRUE(guard->Next(&chunk));
  guard.reset();
  EXPECT_TRUE(destroyed_);
  EXPECT_EQ(0, delegate_.calls);
}

}
}
}
