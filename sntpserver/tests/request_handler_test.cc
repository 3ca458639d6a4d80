// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file request_handler_test.cc
 * @brief Response assembly and validation rules of the request handler.
 */
#include "internal/request_handler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "sntpserver/ntp_types.hpp"

namespace sntpserver {
namespace internal {
namespace {

class FakeTimeSource : public TimeSource {
 public:
  explicit FakeTimeSource(const TimeSpec& now) : now_(now), ref_(now) {}
  TimeSpec NowUnix() override { return now_; }
  TimeSpec ReferenceTime() override { return ref_; }
  void SetReference(const TimeSpec& t) { ref_ = t; }

 private:
  TimeSpec now_;
  TimeSpec ref_;
};

class ZeroRandomSource : public RandomSource {
 public:
  bool Fill(uint8_t* buf, size_t len) override {
    if (fail_) return false;
    for (size_t i = 0; i < len; ++i) buf[i] = 0;
    return true;
  }
  void SetFail(bool fail) { fail_ = fail; }

 private:
  bool fail_ = false;
};

/** Records datagrams instead of sending them. */
class FakeSocket : public platform::ISocket {
 public:
  bool Bind(const std::string&, uint16_t) override { return true; }
  uint16_t LocalPort() const override { return 0; }
  platform::WaitResult WaitReadable(int64_t) override {
    return platform::WaitResult::kTimeout;
  }
  bool Receive(platform::Endpoint*, std::vector<uint8_t>*, size_t) override {
    return false;
  }
  bool Send(const platform::Endpoint& to,
            const std::vector<uint8_t>& data) override {
    if (fail_send) return false;
    sent_to.push_back(to);
    sent.push_back(data);
    return true;
  }
  void Close() override {}
  std::string GetLastError() const override { return "send refused"; }

  bool fail_send = false;
  std::vector<platform::Endpoint> sent_to;
  std::vector<std::vector<uint8_t>> sent;
};

constexpr uint64_t kClientTx = 0xE8A1B2C3D4E5F607ULL;

std::vector<uint8_t> MakeRequest(Mode mode, uint8_t version) {
  NtpPacket req;
  req.SetVersion(version);
  req.SetMode(mode);
  req.poll = PollInterval::kMaximum;
  req.tx_timestamp = kClientTx;
  return req.Encode();
}

RequestHandler::Config DefaultConfig() {
  RequestHandler::Config cfg;
  cfg.reference_source = refsource::kLocal;
  cfg.precision = Precision::kOneMicrosecond;
  return cfg;
}

RequestHandler MakeHandler(std::shared_ptr<TimeSource> ts) {
  return RequestHandler(std::move(ts),
                        TimestampEncoder(std::make_shared<ZeroRandomSource>()),
                        DefaultConfig());
}

}  // namespace

/**
 * @test RequestHandlerTest.BuildsStratumOneServerResponse
 * @brief A client/v4 request yields a server/v4 stratum 1 LOCL response.
 * @expected
 * - poll echoed, precision -20, LI=0.
 * - orig_timestamp equals the request transmit timestamp bit for bit.
 * - recv/ref timestamps come from the arrival time and the reference time.
 * - transmit timestamp is left zero until StampTransmitTime().
 */
TEST(RequestHandlerTest, BuildsStratumOneServerResponse) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000100, 0));
  ts->SetReference(TimeSpec(1700000000, 0));
  RequestHandler handler = MakeHandler(ts);

  const TimeSpec t_recv(1700000050, 500000000u);
  std::vector<uint8_t> out;
  std::string error;
  ASSERT_EQ(handler.BuildResponse(MakeRequest(Mode::kClient, 4), t_recv, &out,
                                  &error),
            RequestHandler::Status::kSent)
      << error;
  ASSERT_EQ(out.size(), kNtpPacketSize);

  NtpPacket resp;
  ASSERT_TRUE(NtpPacket::Decode(out, &resp));
  EXPECT_EQ(resp.GetMode(), Mode::kServer);
  EXPECT_EQ(resp.GetVersion(), 4);
  EXPECT_EQ(resp.GetLeapIndicator(), LeapIndicator::kNoAdjustment);
  EXPECT_EQ(resp.stratum, Stratum::kPrimary);
  EXPECT_EQ(resp.poll, PollInterval::kMaximum);
  EXPECT_EQ(resp.precision, Precision::kOneMicrosecond);
  EXPECT_EQ(resp.ReferenceCode(), "LOCL");
  EXPECT_EQ(resp.root_delay, 0u);
  EXPECT_EQ(resp.root_dispersion, 0u);
  EXPECT_EQ(resp.orig_timestamp, kClientTx);
  EXPECT_EQ(resp.recv_timestamp, t_recv.ToNtpTimestamp());
  EXPECT_EQ(resp.ref_timestamp, TimeSpec(1700000000, 0).ToNtpTimestamp());
  EXPECT_EQ(resp.tx_timestamp, 0u);
}

TEST(RequestHandlerTest, RejectsNonClientModes) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000000, 0));
  RequestHandler handler = MakeHandler(ts);

  for (Mode mode : {Mode::kReserved, Mode::kSymmetricActive,
                    Mode::kSymmetricPassive, Mode::kServer, Mode::kBroadcast,
                    Mode::kControlMessage, Mode::kPrivate}) {
    std::vector<uint8_t> out;
    std::string error;
    EXPECT_EQ(handler.BuildResponse(MakeRequest(mode, 4), ts->NowUnix(), &out,
                                    &error),
              RequestHandler::Status::kInvalidRequest);
    EXPECT_TRUE(out.empty());
    EXPECT_NE(error.find("mode="), std::string::npos);
  }
}

TEST(RequestHandlerTest, RejectsVersionsOtherThanFour) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000000, 0));
  RequestHandler handler = MakeHandler(ts);

  for (uint8_t vn : {0, 1, 2, 3, 5, 7}) {
    std::vector<uint8_t> out;
    EXPECT_EQ(handler.BuildResponse(MakeRequest(Mode::kClient, vn),
                                    ts->NowUnix(), &out, nullptr),
              RequestHandler::Status::kInvalidRequest);
  }
}

TEST(RequestHandlerTest, RejectsTruncatedRequest) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000000, 0));
  RequestHandler handler = MakeHandler(ts);

  std::vector<uint8_t> req = MakeRequest(Mode::kClient, 4);
  req.resize(20);
  std::vector<uint8_t> out;
  std::string error;
  EXPECT_EQ(handler.BuildResponse(req, ts->NowUnix(), &out, &error),
            RequestHandler::Status::kMalformed);
  EXPECT_NE(error.find("size=20"), std::string::npos);
}

TEST(RequestHandlerTest, EncodeFailureIsReported) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000000, 0));
  auto rnd = std::make_shared<ZeroRandomSource>();
  rnd->SetFail(true);
  RequestHandler handler(ts, TimestampEncoder(rnd), DefaultConfig());

  FakeSocket sock;
  std::mutex mtx;
  std::string error;
  EXPECT_EQ(handler.Handle(MakeRequest(Mode::kClient, 4), ts->NowUnix(),
                           platform::Endpoint("127.0.0.1", 40000), &sock, &mtx,
                           &error),
            RequestHandler::Status::kEncodeFailed);
  EXPECT_TRUE(sock.sent.empty());
  EXPECT_FALSE(error.empty());
}

/**
 * @test RequestHandlerTest.HandleStampsTransmitTimeAndSends
 * @brief The transmit field (last 8 bytes) carries "now" when sent.
 */
TEST(RequestHandlerTest, HandleStampsTransmitTimeAndSends) {
  const TimeSpec now(1700000200, 750000000u);
  RequestHandler handler = MakeHandler(std::make_shared<FakeTimeSource>(now));

  FakeSocket sock;
  std::mutex mtx;
  std::string error;
  const platform::Endpoint to("127.0.0.1", 40001);
  ASSERT_EQ(handler.Handle(MakeRequest(Mode::kClient, 4), now, to, &sock, &mtx,
                           &error),
            RequestHandler::Status::kSent)
      << error;
  ASSERT_EQ(sock.sent.size(), 1u);
  EXPECT_EQ(sock.sent_to[0].address, "127.0.0.1");
  EXPECT_EQ(sock.sent_to[0].port, 40001);

  const std::vector<uint8_t>& wire = sock.sent[0];
  ASSERT_EQ(wire.size(), kNtpPacketSize);
  EXPECT_EQ(LoadBe64(wire.data() + kTxTimestampOffset), now.ToNtpTimestamp());

  NtpPacket resp;
  ASSERT_TRUE(NtpPacket::Decode(wire, &resp));
  EXPECT_EQ(resp.orig_timestamp, kClientTx);
}

TEST(RequestHandlerTest, SendFailureIsReported) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000000, 0));
  RequestHandler handler = MakeHandler(ts);

  FakeSocket sock;
  sock.fail_send = true;
  std::mutex mtx;
  std::string error;
  EXPECT_EQ(handler.Handle(MakeRequest(Mode::kClient, 4), ts->NowUnix(),
                           platform::Endpoint("127.0.0.1", 40002), &sock, &mtx,
                           &error),
            RequestHandler::Status::kSendFailed);
  EXPECT_NE(error.find("send refused"), std::string::npos);
}

/** True when another thread currently holds mtx. */
bool HeldElsewhere(std::mutex* mtx) {
  bool held = false;
  std::thread t([&] {
    if (mtx->try_lock()) {
      mtx->unlock();
    } else {
      held = true;
    }
  });
  t.join();
  return held;
}

class LockCheckingTimeSource : public FakeTimeSource {
 public:
  LockCheckingTimeSource(const TimeSpec& now, std::mutex* mtx)
      : FakeTimeSource(now), mtx_(mtx) {}
  TimeSpec NowUnix() override {
    ++calls;
    if (HeldElsewhere(mtx_)) called_under_lock = true;
    return FakeTimeSource::NowUnix();
  }

  std::atomic<int> calls{0};
  std::atomic<bool> called_under_lock{false};

 private:
  std::mutex* mtx_;
};

class LockCheckingRandomSource : public ZeroRandomSource {
 public:
  explicit LockCheckingRandomSource(std::mutex* mtx) : mtx_(mtx) {}
  bool Fill(uint8_t* buf, size_t len) override {
    ++calls;
    if (HeldElsewhere(mtx_)) called_under_lock = true;
    return ZeroRandomSource::Fill(buf, len);
  }

  std::atomic<int> calls{0};
  std::atomic<bool> called_under_lock{false};

 private:
  std::mutex* mtx_;
};

/**
 * @test RequestHandlerTest.SendLockIsNotHeldWhileStamping
 * @brief The clock and the random source are read before send_mtx is
 *        taken, so a slow source never blocks other handlers' sends.
 */
TEST(RequestHandlerTest, SendLockIsNotHeldWhileStamping) {
  std::mutex mtx;
  const TimeSpec now(1700000300, 123456789u);
  auto ts = std::make_shared<LockCheckingTimeSource>(now, &mtx);
  auto rnd = std::make_shared<LockCheckingRandomSource>(&mtx);
  RequestHandler handler(ts, TimestampEncoder(rnd), DefaultConfig());

  FakeSocket sock;
  std::string error;
  ASSERT_EQ(handler.Handle(MakeRequest(Mode::kClient, 4), now,
                           platform::Endpoint("127.0.0.1", 40003), &sock, &mtx,
                           &error),
            RequestHandler::Status::kSent)
      << error;
  EXPECT_GE(ts->calls.load(), 1);
  EXPECT_GE(rnd->calls.load(), 1);
  EXPECT_FALSE(ts->called_under_lock.load());
  EXPECT_FALSE(rnd->called_under_lock.load());
  EXPECT_EQ(sock.sent.size(), 1u);
}

TEST(RequestHandlerTest, StampTransmitTimeRejectsShortBuffer) {
  auto ts = std::make_shared<FakeTimeSource>(TimeSpec(1700000000, 0));
  RequestHandler handler = MakeHandler(ts);

  std::vector<uint8_t> buf(10, 0);
  EXPECT_FALSE(handler.StampTransmitTime(&buf, nullptr));
}

}  // namespace internal
}  // namespace sntpserver
