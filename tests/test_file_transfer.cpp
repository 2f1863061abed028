// Tests for the file transfer server over loopback TCP.
#include "vidsync/client.h"
#include "vidsync/file_transfer.h"

#include "test_util.h"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using vidsync::TransferResult;

namespace {

// Collects reports delivered on the server thread.
class ReportCollector {
 public:
  void Add(const vidsync::TransferReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    reports_.push_back(report);
    cv_.notify_all();
  }

  bool WaitFor(size_t count, std::chrono::milliseconds timeout =
                                 std::chrono::milliseconds(5000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return reports_.size() >= count; });
  }

  vidsync::TransferReport At(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_.at(index);
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<vidsync::TransferReport> reports_;
};

class FileTransferServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    config_ = vidsync_test::MakeTestConfig(dir_);
    ASSERT_TRUE(vidsync_test::WriteFile(config_.media_path, "original content"));
  }

  void StartServer() {
    server_.reset(new vidsync::FileTransferServer(config_));
    server_->SetCanReceivePredicate([this]() { return can_receive_.load(); });
    server_->SetTransferCallback(
        [this](const vidsync::TransferReport& report) { reports_.Add(report); });
    ASSERT_TRUE(server_->Start()) << server_->GetLastError();
    ASSERT_NE(server_->BoundPort(), 0);
  }

  vidsync_test::TempDir dir_;
  vidsync::DeviceConfig config_;
  std::atomic<bool> can_receive_{true};
  ReportCollector reports_;
  std::unique_ptr<vidsync::FileTransferServer> server_;
};

}  // namespace

TEST_F(FileTransferServerTest, RoundTripReplacesMedia) {
  StartServer();
  const std::string payload = vidsync_test::MakePayload(200000);
  const std::string source = dir_.File("upload.mp4");
  ASSERT_TRUE(vidsync_test::WriteFile(source, payload));

  std::vector<uint64_t> progress;
  vidsync::ClientOptions options;
  options.progress_callback = [&](uint64_t sent, uint64_t total) {
    EXPECT_EQ(total, payload.size());
    progress.push_back(sent);
  };
  std::string error;
  EXPECT_EQ(vidsync::SendFile(source, "127.0.0.1", server_->BoundPort(), options, &error),
            vidsync::SendFileResult::kOk)
      << error;

  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), payload);
  EXPECT_FALSE(vidsync_test::FileExists(config_.EffectiveStagingPath()));
  ASSERT_FALSE(progress.empty());
  EXPECT_EQ(progress.back(), payload.size());

  ASSERT_TRUE(reports_.WaitFor(1));
  const vidsync::TransferReport report = reports_.At(0);
  EXPECT_EQ(report.result, TransferResult::kCompleted);
  EXPECT_EQ(report.declared_bytes, payload.size());
  EXPECT_EQ(report.received_bytes, payload.size());
  EXPECT_NE(report.peer.find("127.0.0.1:"), std::string::npos);
}

TEST_F(FileTransferServerTest, ZeroLengthFileIsCommitted) {
  StartServer();
  const std::string source = dir_.File("empty.mp4");
  ASSERT_TRUE(vidsync_test::WriteFile(source, ""));
  EXPECT_EQ(vidsync::SendFile(source, "127.0.0.1", server_->BoundPort()),
            vidsync::SendFileResult::kOk);
  EXPECT_TRUE(vidsync_test::FileExists(config_.media_path));
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "");
}

TEST_F(FileTransferServerTest, BusyWhenPredicateRejects) {
  can_receive_ = false;
  StartServer();

  vidsync_test::LoopbackConnection conn(server_->BoundPort());
  ASSERT_TRUE(conn.valid());
  EXPECT_EQ(conn.ReadLine(), "BUSY");
  EXPECT_TRUE(conn.ReadEof());

  ASSERT_TRUE(reports_.WaitFor(1));
  EXPECT_EQ(reports_.At(0).result, TransferResult::kBusy);
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
  EXPECT_FALSE(server_->IsReceiving());
}

// The flag is dropped once the predicate refuses, before BUSY goes out.
TEST_F(FileTransferServerTest, BusyReplyClearsReceivingFlag) {
  std::atomic<bool> seen_during_predicate{false};
  server_.reset(new vidsync::FileTransferServer(config_));
  server_->SetCanReceivePredicate([this, &seen_during_predicate]() {
    seen_during_predicate = server_->IsReceiving();
    return false;
  });
  ASSERT_TRUE(server_->Start()) << server_->GetLastError();

  vidsync_test::LoopbackConnection conn(server_->BoundPort());
  ASSERT_TRUE(conn.valid());
  ASSERT_EQ(conn.ReadLine(), "BUSY");
  EXPECT_FALSE(server_->IsReceiving());
  EXPECT_TRUE(seen_during_predicate);
  server_->Stop();
}

TEST_F(FileTransferServerTest, ClientReportsBusy) {
  can_receive_ = false;
  StartServer();
  const std::string source = dir_.File("upload.mp4");
  ASSERT_TRUE(vidsync_test::WriteFile(source, "new content"));
  std::string error;
  EXPECT_EQ(vidsync::SendFile(source, "127.0.0.1", server_->BoundPort(), {}, &error),
            vidsync::SendFileResult::kBusy);
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
}

TEST_F(FileTransferServerTest, PartialTransferKeepsPreviousMedia) {
  StartServer();
  vidsync_test::LoopbackConnection conn(server_->BoundPort());
  ASSERT_TRUE(conn.valid());
  ASSERT_EQ(conn.ReadLine(), "READY");
  ASSERT_TRUE(conn.SendLength(1000));
  ASSERT_TRUE(conn.Send(vidsync_test::MakePayload(400)));
  conn.ShutdownWrite();
  EXPECT_EQ(conn.ReadLine(), "ERROR");

  ASSERT_TRUE(reports_.WaitFor(1));
  const vidsync::TransferReport report = reports_.At(0);
  EXPECT_EQ(report.result, TransferResult::kPartialTransfer);
  EXPECT_EQ(report.declared_bytes, 1000u);
  EXPECT_EQ(report.received_bytes, 400u);
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
  EXPECT_FALSE(vidsync_test::FileExists(config_.EffectiveStagingPath()));
}

TEST_F(FileTransferServerTest, ShortHeaderIsProtocolError) {
  StartServer();
  vidsync_test::LoopbackConnection conn(server_->BoundPort());
  ASSERT_TRUE(conn.valid());
  ASSERT_EQ(conn.ReadLine(), "READY");
  ASSERT_TRUE(conn.Send(std::string("\x00\x00\x01", 3)));
  conn.ShutdownWrite();
  EXPECT_EQ(conn.ReadLine(), "ERROR");

  ASSERT_TRUE(reports_.WaitFor(1));
  EXPECT_EQ(reports_.At(0).result, TransferResult::kProtocolError);
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
}

TEST_F(FileTransferServerTest, StalledSenderTimesOut) {
  config_.transfer_timeout = std::chrono::milliseconds(200);
  StartServer();
  vidsync_test::LoopbackConnection conn(server_->BoundPort());
  ASSERT_TRUE(conn.valid());
  ASSERT_EQ(conn.ReadLine(), "READY");
  ASSERT_TRUE(conn.SendLength(64));
  EXPECT_EQ(conn.ReadLine(), "ERROR");

  ASSERT_TRUE(reports_.WaitFor(1));
  EXPECT_EQ(reports_.At(0).result, TransferResult::kConnectionTimeout);
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
  EXPECT_FALSE(vidsync_test::FileExists(config_.EffectiveStagingPath()));
}

TEST_F(FileTransferServerTest, ReceivingFlagCoversConnection) {
  StartServer();
  EXPECT_FALSE(server_->IsReceiving());
  {
    vidsync_test::LoopbackConnection conn(server_->BoundPort());
    ASSERT_TRUE(conn.valid());
    ASSERT_EQ(conn.ReadLine(), "READY");
    EXPECT_TRUE(server_->IsReceiving());
  }
  ASSERT_TRUE(reports_.WaitFor(1));
  EXPECT_FALSE(server_->IsReceiving());
}

TEST_F(FileTransferServerTest, StopInterruptsActiveTransfer) {
  config_.transfer_timeout = std::chrono::milliseconds(30000);
  StartServer();
  vidsync_test::LoopbackConnection conn(server_->BoundPort());
  ASSERT_TRUE(conn.valid());
  ASSERT_EQ(conn.ReadLine(), "READY");
  ASSERT_TRUE(conn.SendLength(1 << 20));

  const auto started = std::chrono::steady_clock::now();
  server_->Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
  EXPECT_FALSE(server_->IsRunning());
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
}

// A client that connects while Stop() waits out the last poll must not be
// handed READY, and Stop() must not wait for its transfer timeout.
TEST_F(FileTransferServerTest, StopRefusesConnectionsDuringFinalPoll) {
  config_.poll_interval = std::chrono::milliseconds(1500);
  config_.transfer_timeout = std::chrono::milliseconds(8000);
  StartServer();
  const uint16_t port = server_->BoundPort();

  std::atomic<bool> stopped{false};
  std::chrono::steady_clock::duration stop_time{};
  std::thread stopper([&]() {
    const auto started = std::chrono::steady_clock::now();
    server_->Stop();
    stop_time = std::chrono::steady_clock::now() - started;
    stopped = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  std::string line;
  {
    vidsync_test::LoopbackConnection conn(port);
    if (conn.valid()) {
      line = conn.ReadLine();
    }
  }
  stopper.join();

  ASSERT_TRUE(stopped);
  EXPECT_NE(line, "READY");
  EXPECT_LT(stop_time, std::chrono::seconds(4));
  EXPECT_FALSE(server_->IsRunning());
  EXPECT_FALSE(server_->IsReceiving());
  EXPECT_EQ(vidsync_test::ReadFile(config_.media_path), "original content");
}

TEST_F(FileTransferServerTest, SecondServerOnSamePortFailsToStart) {
  StartServer();
  vidsync::DeviceConfig other = config_;
  other.transfer_port = server_->BoundPort();
  vidsync::FileTransferServer second(other);
  EXPECT_FALSE(second.Start());
  EXPECT_FALSE(second.GetLastError().empty());
  EXPECT_FALSE(second.IsRunning());
}

TEST(SendFileTest, MissingSourceFile) {
  std::string error;
  EXPECT_EQ(vidsync::SendFile("/nonexistent/vidsync/upload.mp4", "127.0.0.1", 1, {},
                              &error),
            vidsync::SendFileResult::kFileNotFound);
  EXPECT_NE(error.find("not found"), std::string::npos);
}

TEST(SendFileTest, UnexpectedHandshake) {
  // A listener that answers with something other than READY or BUSY.
  vidsync_test::TempDir dir;
  ASSERT_TRUE(dir.valid());
  const std::string source = dir.File("upload.mp4");
  ASSERT_TRUE(vidsync_test::WriteFile(source, "data"));

  const int listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(listen_fd, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(::bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(listen_fd, 1), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

  std::thread responder([listen_fd]() {
    const int conn = ::accept(listen_fd, nullptr, nullptr);
    if (conn >= 0) {
      const char reply[] = "HELLO\n";
      ::send(conn, reply, sizeof(reply) - 1, MSG_NOSIGNAL);
      ::close(conn);
    }
  });
  std::string error;
  EXPECT_EQ(vidsync::SendFile(source, "127.0.0.1", ntohs(addr.sin_port), {}, &error),
            vidsync::SendFileResult::kUnexpectedResponse);
  EXPECT_NE(error.find("HELLO"), std::string::npos);
  responder.join();
  ::close(listen_fd);
}
