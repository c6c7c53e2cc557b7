#ifndef SPEEDTEST_STREAM_TIMEOUT_GUARDED_STREAM_H_
#define SPEEDTEST_STREAM_TIMEOUT_GUARDED_STREAM_H_

#include <memory>
#include <string>

#include "net/speedtest/stream/chunk_stream.h"

#include "net/third_party/quiche/src/quic/core/quic_alarm.h"
#include "net/third_party/quiche/src/quic/core/quic_alarm_factory.h"
#include "net/third_party/quiche/src/quic/core/quic_time.h"
#include "net/third_party/quiche/src/quic/core/quic_clock.h"

namespace speedtest {

namespace test {
class TimeoutGuardedStreamPeer;
}

// TimeoutGuardedStream bounds the time a consumer may take between two
// blocks. The deadline is `timeout` after construction and is moved to
// `timeout` after every block handed out. Once the deadline passes the
// stream ends as if the wrapped stream had run out of data: no error is
// reported, Next() just returns false.
//
// The wrapped stream is released as soon as the deadline alarm fires, so a
// stalled consumer does not keep the generator and its buffer alive.
class TimeoutGuardedStream : public ChunkStream {
 public:
  class Delegate {
   public:
    virtual ~Delegate() {}
    // Called once, from the alarm, when the deadline has passed. The
    // guarded stream must not be destroyed from inside this call.
    virtual void OnDeadlineExpired() = 0;
  };

  // `clock` and `alarm_factory` must outlive the stream. `delegate` may be
  // null.
  TimeoutGuardedStream(std::unique_ptr<ChunkStream> stream,
                       quic::QuicTime::Delta timeout,
                       const quic::QuicClock* clock,
                       quic::QuicAlarmFactory* alarm_factory,
                       Delegate* delegate);
  TimeoutGuardedStream(const TimeoutGuardedStream&) = delete;
  TimeoutGuardedStream& operator=(const TimeoutGuardedStream&) = delete;
  ~TimeoutGuardedStream() override;

  bool Next(std::string* chunk) override;

  bool expired() const { return expired_; }
  quic::QuicTime deadline() const { return deadline_; }

 private:
  friend class test::TimeoutGuardedStreamPeer;
  class DeadlineAlarmDelegate;

  void OnAlarm();
  void Expire();

  std::unique_ptr<ChunkStream> stream_;
  quic::QuicTime::Delta timeout_;
  const quic::QuicClock* clock_;
  Delegate* delegate_;

  quic::QuicTime deadline_;
  bool expired_;
  std::unique_ptr<quic::QuicAlarm> alarm_;
};

}

#endif
