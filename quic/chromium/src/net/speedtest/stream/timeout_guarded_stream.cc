#include "net/speedtest/stream/timeout_guarded_stream.h"

#include <utility>

#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace {

// Moving the deadline by less than this does not re-arm the alarm; an alarm
// that fires early just re-arms itself for the real deadline.
const int64_t kAlarmGranularityMs = 1000;

}

namespace speedtest {

class TimeoutGuardedStream::DeadlineAlarmDelegate
    : public quic::QuicAlarm::Delegate {
 public:
  explicit DeadlineAlarmDelegate(TimeoutGuardedStream* stream)
    : stream_(stream) {}
  DeadlineAlarmDelegate(const DeadlineAlarmDelegate&) = delete;
  DeadlineAlarmDelegate& operator=(const DeadlineAlarmDelegate&) = delete;

  void OnAlarm() override { stream_->OnAlarm(); }

 private:
  TimeoutGuardedStream* stream_;
};

TimeoutGuardedStream::TimeoutGuardedStream(
  std::unique_ptr<ChunkStream> stream,
  quic::QuicTime::Delta timeout,
  const quic::QuicClock* clock,
  quic::QuicAlarmFactory* alarm_factory,
  Delegate* delegate
) : stream_(std::move(stream))
  , timeout_(timeout)
  , clock_(clock)
  , delegate_(delegate)
  , deadline_(clock->Now() + timeout)
  , expired_(false)
  , alarm_(alarm_factory->CreateAlarm(new DeadlineAlarmDelegate(this))) {
  alarm_->Set(deadline_);
}

TimeoutGuardedStream::~TimeoutGuardedStream() {
  alarm_->Cancel();
}

bool TimeoutGuardedStream::Next(std::string* chunk) {
  if (expired_ || stream_ == nullptr) {
    return false;
  }
  if (clock_->Now() >= deadline_) {
    // the consumer came back too late; it sees the end of the data
    Expire();
    return false;
  }
  if (!stream_->Next(chunk)) {
    stream_.reset();
    alarm_->Cancel();
    return false;
  }

  deadline_ = clock_->Now() + timeout_;
  alarm_->Update(deadline_,
                 quic::QuicTime::Delta::FromMilliseconds(kAlarmGranularityMs));
  return true;
}

void TimeoutGuardedStream::OnAlarm() {
  if (expired_ || stream_ == nullptr) {
    return;
  }
  if (clock_->Now() < deadline_) {
    alarm_->Set(deadline_);
    return;
  }

  Expire();
  if (delegate_ != nullptr) {
    delegate_->OnDeadlineExpired();
  }
}

void TimeoutGuardedStream::Expire() {
  QUIC_DVLOG(1) << "Send deadline passed, ending stream";
  expired_ = true;
  stream_.reset();
  alarm_->Cancel();
}

}
