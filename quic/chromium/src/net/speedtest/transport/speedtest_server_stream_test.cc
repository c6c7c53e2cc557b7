#include "net/speedtest/transport/speedtest_server_stream.h"

#include <stdint.h>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "base/files/file_path.h"
#include "base/files/scoped_temp_dir.h"

#include "net/third_party/quiche/src/quic/core/quic_versions.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_test.h"
#include "net/third_party/quiche/src/quic/test_tools/quic_test_utils.h"

using quic::QuicConsumedData;
using quic::QuicTime;
using spdy::SpdyHeaderBlock;
using testing::Invoke;
using testing::NiceMock;
using testing::Return;

namespace speedtest {
namespace test {

class SpeedtestServerStreamPeer {
 public:
  static quic::QuicAlarm* GetFinishAlarm(SpeedtestServerStream* stream) {
    return stream->finish_alarm_.get();
  }

  static TransferAccount* GetTransfer(SpeedtestServerStream* stream) {
    return stream->transfer_.get();
  }

  static bool FinSent(SpeedtestServerStream* stream) {
    return stream->fin_sent_;
  }
};

namespace {

const int64_t kTimeoutSecs = 20;

// Google QUIC versions write headers on the headers stream, so the request
// stream only carries the body.
quic::ParsedQuicVersionVector GoogleQuicVersions() {
  quic::ParsedQuicVersionVector versions;
  for (const quic::ParsedQuicVersion& version : quic::AllSupportedVersions()) {
    if (version.handshake_protocol == quic::PROTOCOL_QUIC_CRYPTO &&
        !quic::VersionUsesHttp3(version.transport_version)) {
      versions.push_back(version);
      break;
    }
  }
  return versions;
}

// Keeps the last alarm created outside of the connection's arena, which is
// the send deadline alarm once a download has started.
class AlarmRecordingFactory : public quic::test::MockAlarmFactory {
 public:
  AlarmRecordingFactory() : last_alarm_(nullptr) {}

  quic::QuicAlarm* CreateAlarm(quic::QuicAlarm::Delegate* delegate) override {
    last_alarm_ = quic::test::MockAlarmFactory::CreateAlarm(delegate);
    return last_alarm_;
  }

  quic::QuicAlarm* last_alarm() const { return last_alarm_; }

 private:
  quic::QuicAlarm* last_alarm_;
};

class SpeedtestServerStreamTest : public quic::QuicTest {
 protected:
  SpeedtestServerStreamTest()
    : connection_(new NiceMock<quic::test::MockQuicConnection>(
        &helper_, &alarm_factory_, quic::Perspective::IS_SERVER,
        GoogleQuicVersions()))
    , session_(new NiceMock<quic::test::MockQuicSpdySession>(connection_)) {
    session_->Initialize();
    BlockWrites();
    connection_->AdvanceTime(QuicTime::Delta::FromSeconds(1));
  }

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    log_path_ = temp_dir_.GetPath().AppendASCII("access.log").value();
    auto config = std::make_shared<SpeedtestConfig>();
    config->access_log = log_path_;
    config->send_timeout_secs = kTimeoutSecs;
    backend_.reset(new SpeedtestBackend(config));
    ASSERT_TRUE(backend_->InitializeBackend(""));

    stream_.reset(new SpeedtestServerStream(
        quic::test::GetNthClientInitiatedBidirectionalStreamId(
            connection_->transport_version(), 0),
        session_.get(), quic::BIDIRECTIONAL, backend_.get()));
  }

  // The peer grants no flow control credit.
  void BlockWrites() {
    ON_CALL(*session_, WritevData)
        .WillByDefault(Return(QuicConsumedData(0, false)));
  }

  void UnblockWrites() {
    ON_CALL(*session_, WritevData)
        .WillByDefault(Invoke(&quic::test::MockQuicSession::ConsumeData));
  }

  void Request(const std::string& path) {
    SpdyHeaderBlock request_headers;
    request_headers[":method"] = "GET";
    request_headers[":path"] = path;
    request_headers[":authority"] = "speedtest.example.org";
    request_headers["user-agent"] = "test-agent";
    backend_->FetchResponseFromBackend(request_headers, "", stream_.get());
  }

  // Runs both halves of a send timeout: the deadline alarm of the body and
  // then the stream's own alarm that ends the body.
  void ExpireDeadline(quic::QuicAlarm* deadline_alarm) {
    connection_->AdvanceTime(QuicTime::Delta::FromSeconds(kTimeoutSecs + 1));
    alarm_factory_.FireAlarm(deadline_alarm);
    quic::QuicAlarm* finish_alarm =
        SpeedtestServerStreamPeer::GetFinishAlarm(stream_.get());
    ASSERT_TRUE(finish_alarm->IsSet());
    alarm_factory_.FireAlarm(finish_alarm);
  }

  std::vector<std::string> LogLines() {
    std::vector<std::string> lines;
    std::ifstream in(log_path_);
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }

  quic::test::MockQuicConnectionHelper helper_;
  AlarmRecordingFactory alarm_factory_;
  // Owned by `session_`.
  NiceMock<quic::test::MockQuicConnection>* connection_;
  std::unique_ptr<NiceMock<quic::test::MockQuicSpdySession>> session_;

  base::ScopedTempDir temp_dir_;
  std::string log_path_;
  std::unique_ptr<SpeedtestBackend> backend_;
  std::unique_ptr<SpeedtestServerStream> stream_;
};

TEST_F(SpeedtestServerStreamTest, ReportsHttpVersionOfConnection) {
  EXPECT_EQ("HTTP/2", stream_->http_version());
  EXPECT_EQ(connection_->clock(), stream_->clock());
  EXPECT_EQ(&alarm_factory_, stream_->alarm_factory());
}

TEST_F(SpeedtestServerStreamTest, StopsPullingWhileBlocked) {
  Request("/1mb");

  TransferAccount* transfer =
      SpeedtestServerStreamPeer::GetTransfer(stream_.get());
  ASSERT_TRUE(transfer);
  EXPECT_TRUE(stream_->HasBufferedData());
  EXPECT_EQ(16384u, transfer->bytes_sent());

  // Still blocked, nothing new is pulled.
  stream_->OnCanWrite();
  EXPECT_EQ(16384u, transfer->bytes_sent());
  EXPECT_FALSE(SpeedtestServerStreamPeer::FinSent(stream_.get()));
  EXPECT_TRUE(LogLines().empty());
}

TEST_F(SpeedtestServerStreamTest, ResumesBodyWhenUnblocked) {
  Request("/10kb");
  TransferAccount* transfer =
      SpeedtestServerStreamPeer::GetTransfer(stream_.get());
  ASSERT_TRUE(transfer);
  EXPECT_TRUE(stream_->HasBufferedData());
  EXPECT_TRUE(LogLines().empty());

  UnblockWrites();
  stream_->OnCanWrite();

  EXPECT_FALSE(stream_->HasBufferedData());
  EXPECT_TRUE(stream_->write_side_closed());
  EXPECT_TRUE(transfer->finalized());
  std::vector<std::string> lines = LogLines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_NE(std::string::npos,
            lines[0].find("\"GET /10kb HTTP/2\" 200 10000 \"\" \"test-agent\""));
}

TEST_F(SpeedtestServerStreamTest, DeadlineEndsBlockedBody) {
  Request("/1mb");
  TransferAccount* transfer =
      SpeedtestServerStreamPeer::GetTransfer(stream_.get());
  ASSERT_TRUE(transfer);
  quic::QuicAlarm* deadline_alarm = alarm_factory_.last_alarm();
  ASSERT_TRUE(deadline_alarm->IsSet());

  // A deadline alarm that fires early changes nothing.
  alarm_factory_.FireAlarm(deadline_alarm);
  EXPECT_FALSE(
      SpeedtestServerStreamPeer::GetFinishAlarm(stream_.get())->IsSet());

  ExpireDeadline(deadline_alarm);

  EXPECT_TRUE(transfer->finalized());
  EXPECT_EQ(16384u, transfer->bytes_sent());
  EXPECT_TRUE(SpeedtestServerStreamPeer::FinSent(stream_.get()));
  // FIN waits behind the block that is already buffered.
  EXPECT_TRUE(stream_->HasBufferedData());
  EXPECT_FALSE(stream_->write_side_closed());

  std::vector<std::string> lines = LogLines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_NE(std::string::npos,
            lines[0].find("\"GET /1mb HTTP/2\" 200 16384 \"\" \"test-agent\""));

  // Once the peer catches up only FIN follows the buffered block.
  UnblockWrites();
  stream_->OnCanWrite();
  EXPECT_TRUE(stream_->write_side_closed());
  EXPECT_EQ(16384u, transfer->bytes_sent());

  stream_.reset();
  EXPECT_EQ(1u, LogLines().size());
}

TEST_F(SpeedtestServerStreamTest, ResetStreamLogsOnceWhenDestroyed) {
  Request("/1mb");
  ASSERT_TRUE(SpeedtestServerStreamPeer::GetTransfer(stream_.get()));

  quic::QuicRstStreamFrame rst(quic::kInvalidControlFrameId, stream_->id(),
                               quic::QUIC_STREAM_CANCELLED, 0);
  stream_->OnStreamReset(rst);
  EXPECT_TRUE(stream_->write_side_closed());
  EXPECT_TRUE(LogLines().empty());

  stream_.reset();
  std::vector<std::string> lines = LogLines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_NE(std::string::npos,
            lines[0].find("\"GET /1mb HTTP/2\" 200 16384 \"\" \"test-agent\""));
}

TEST_F(SpeedtestServerStreamTest, DeadlineAfterResetLogsOnce) {
  Request("/1mb");
  quic::QuicAlarm* deadline_alarm = alarm_factory_.last_alarm();

  quic::QuicRstStreamFrame rst(quic::kInvalidControlFrameId, stream_->id(),
                               quic::QUIC_STREAM_CANCELLED, 0);
  stream_->OnStreamReset(rst);
  ExpireDeadline(deadline_alarm);

  EXPECT_TRUE(
      SpeedtestServerStreamPeer::GetTransfer(stream_.get())->finalized());
  EXPECT_EQ(1u, LogLines().size());

  stream_.reset();
  EXPECT_EQ(1u, LogLines().size());
}

TEST_F(SpeedtestServerStreamTest, EmptyBodySendsOnlyFin) {
  Request("/0b");

  TransferAccount* transfer =
      SpeedtestServerStreamPeer::GetTransfer(stream_.get());
  ASSERT_TRUE(transfer);
  EXPECT_TRUE(transfer->finalized());
  EXPECT_EQ(0u, transfer->bytes_sent());
  EXPECT_TRUE(SpeedtestServerStreamPeer::FinSent(stream_.get()));
  EXPECT_FALSE(stream_->HasBufferedData());

  std::vector<std::string> lines = LogLines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_NE(std::string::npos,
            lines[0].find("\"GET /0b HTTP/2\" 200 - \"\" \"test-agent\""));

  UnblockWrites();
  stream_->OnCanWrite();
  EXPECT_TRUE(stream_->write_side_closed());
  EXPECT_EQ(0u, stream_->stream_bytes_written());
}

}
}
}
