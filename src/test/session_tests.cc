#include <glog/logging.h>
#include <gtest/gtest.h>
#include <rdsync/checksums/strong_checksum.h>
#include <rdsync/common/errors.h>
#include <rdsync/session/file_store.h>
#include <rdsync/session/transfer_session.h>
#include <rdsync/test_common/expectation_check_metric_visitor.h>
#include <rdsync/test_common/test_fixture.h>
#include <rdsync/transport/data_stream.h>
#include <rdsync/transport/frame_multiplexer.h>
#include <rdsync/transport/socket_transport.h>
#include <rdsync/wire/byte_io.h>
#include <rdsync/wire/instruction_codec.h>
#include <rdsync/wire/signature_codec.h>

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <cstring>
#include <functional>
#include <thread>

#include "../rdsync/session/pb/file_list_adapter.h"

namespace rdsync {

namespace {

// serves its data unchanged once, then with every byte flipped
class FlippingReader final : public Reader {
  std::string data_;
  std::streamsize served_{};

public:
  explicit FlippingReader(std::string data) : data_(std::move(data)) {}

  [[nodiscard]] std::streamsize GetSize() const override {
    return static_cast<std::streamsize>(data_.size());
  }

  std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size) override {
    auto count = std::clamp<std::streamsize>(GetSize() - offset, 0, size);
    memcpy(buffer, data_.data() + offset, count);
    if (served_ >= GetSize()) {
      auto *bytes = static_cast<char *>(buffer);
      for (std::streamsize i = 0; i < count; i++) {
        bytes[i] = static_cast<char>(bytes[i] ^ 0x01);
      }
    }
    served_ += count;
    return Reader::Read(buffer, offset, count);
  }
};

// a basis that changes between signature and reconstruction
class FlippingStore final : public MemoryFileStore {
public:
  std::unique_ptr<Reader> OpenForRead(const std::string &path) override {
    if (!Contains(path)) {
      return nullptr;
    }
    return std::make_unique<FlippingReader>(Get(path));
  }
};

// source files that cannot be opened
class FailingStore final : public MemoryFileStore {
public:
  std::unique_ptr<Reader> OpenForRead(const std::string &path) override {
    if (path.starts_with("bad")) {
      throw IoError(path + ": permission denied");
    }
    return MemoryFileStore::OpenForRead(path);
  }
};

}  // namespace

class SessionTests : public Fixture {
protected:
  boost::asio::io_context io_context_;

  struct Result {
    TransferReport sender;
    TransferReport receiver;
    uint32_t sender_seed{};
    uint32_t receiver_seed{};
    SessionState sender_state{};
    SessionState receiver_state{};
  };

  using Inspector =
      std::function<void(TransferSession &sender, TransferSession &receiver)>;

  Result Transfer(
      FileStore &source,
      FileStore &destination,
      const SessionConfig &sender_config = {},
      const SessionConfig &receiver_config = {},
      const Inspector &inspect = nullptr) {
    auto transports = CreateLocalPair(io_context_);
    TransferSession sender(
        Role::kSender,
        sender_config,
        *transports.first,
        source);
    TransferSession receiver(
        Role::kReceiver,
        receiver_config,
        *transports.second,
        destination);

    Result result;
    std::thread thread([&sender, &result] { result.sender = sender.Run(); });
    result.receiver = receiver.Run();
    thread.join();

    result.sender_seed = sender.GetSeed();
    result.receiver_seed = receiver.GetSeed();
    result.sender_state = sender.GetState();
    result.receiver_state = receiver.GetState();

    if (inspect) {
      inspect(sender, receiver);
    }
    return result;
  }

  // peer side of the handshake, as a sender
  static void HandshakeAsSender(Transport &transport, uint32_t seed) {
    std::string version(4, '\0');
    transport.ReadExact(version.data(), 4);
    StringSource version_source(version);
    EXPECT_EQ(wire::ReadI32(version_source), kProtocolVersion);

    StringSink sink;
    wire::WriteI32(sink, kProtocolVersion);
    wire::WriteU32(sink, seed);
    transport.WriteAll(
        sink.GetData().data(),
        static_cast<std::streamsize>(sink.GetData().size()));
  }

  static void SendFileList(
      DataStream &stream,
      const std::vector<FileEntry> &entries) {
    auto data = FileListAdapter::Serialize(entries);
    wire::WriteVarint(stream, data.size());
    wire::WriteBytes(
        stream,
        data.data(),
        static_cast<std::streamsize>(data.size()));
    stream.Flush();
  }

  static SignatureTable
  ExpectRequest(DataStream &stream, int32_t index, uint32_t seed) {
    EXPECT_EQ(wire::ReadI32(stream), index);
    return wire::ReadSignature(stream, seed, 1'000'000);
  }

  static void SendFile(
      DataStream &stream,
      int32_t index,
      const std::vector<Instruction> &instructions,
      const StrongChecksum &digest) {
    wire::WriteI32(stream, index);
    for (const auto &instruction : instructions) {
      wire::WriteInstruction(stream, instruction);
    }
    auto bytes = digest.ToBytes();
    wire::WriteBytes(stream, bytes.data(), StrongChecksum::kSize);
    stream.Flush();
  }

  static void ExpectFailure(
      const TransferReport &report,
      const std::string &path,
      FileErrorKind kind) {
    ASSERT_EQ(report.failures.size(), 1) << report;
    EXPECT_EQ(report.failures[0].path, path);
    EXPECT_EQ(report.failures[0].kind, kind) << report.failures[0].message;
  }
};

TEST_F(SessionTests, MultipleFiles) {  // NOLINT
  auto a = GenerateData(100'000, 1);
  auto b = GenerateData(200'000, 2);

  MemoryFileStore source;
  source.Put({.path = "a.txt", .mtime = 1'600'000'000, .mode = 0644}, a);
  source.Put({.path = "dir/b.bin", .mtime = 1'700'000'000, .mode = 0755}, b);
  source.Put("empty", "");

  // a stale copy of a.txt: same head, different tail
  MemoryFileStore destination;
  destination.Put("a.txt", a.substr(0, 60'000) + GenerateData(10'000, 3));

  auto result = Transfer(
      source,
      destination,
      {},
      {},
      [](TransferSession &sender, TransferSession &receiver) {
        ExpectationCheckMetricVisitor(
            sender,
            {//
             {"//files_completed_", 3},
             {"//files_failed_", 0}});
        ExpectationCheckMetricVisitor(
            receiver,
            {//
             {"//files_completed_", 3},
             {"//files_failed_", 0}});
      });

  EXPECT_TRUE(result.sender.IsSuccess()) << result.sender;
  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(result.sender_state, SessionState::kClosed);
  EXPECT_EQ(result.receiver_state, SessionState::kClosed);
  EXPECT_EQ(result.sender_seed, result.receiver_seed);

  EXPECT_EQ(
      result.receiver.completed,
      (std::vector<std::string>{"a.txt", "dir/b.bin", "empty"}));
  EXPECT_EQ(destination.Get("a.txt"), a);
  EXPECT_EQ(destination.Get("dir/b.bin"), b);
  EXPECT_EQ(destination.Get("empty"), "");
  // mode and mtime travel with the list
  EXPECT_EQ(destination.List(), source.List());

  const auto &stats = result.receiver.stats;
  EXPECT_GE(stats.matched_bytes, 50'000);
  EXPECT_EQ(stats.literal_bytes + stats.matched_bytes, 300'000);
  EXPECT_EQ(stats.literal_bytes, result.sender.stats.literal_bytes);
  EXPECT_EQ(stats.matched_bytes, result.sender.stats.matched_bytes);

  // reported by the sender
  EXPECT_EQ(stats.total_size, 300'000);
  EXPECT_EQ(result.sender.stats.total_size, 300'000);
  EXPECT_EQ(stats.bytes_written, result.sender.stats.bytes_written);
  EXPECT_GT(stats.bytes_written, stats.literal_bytes);
  EXPECT_GT(stats.bytes_read, 0);
}

TEST_F(SessionTests, MissingBasisIsSentAsData) {  // NOLINT
  MemoryFileStore source;
  source.Put("hello.txt", "HELLO");
  MemoryFileStore destination;

  auto result = Transfer(source, destination);

  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(destination.Get("hello.txt"), "HELLO");
  EXPECT_EQ(result.receiver.stats.literal_bytes, 5);
  EXPECT_EQ(result.receiver.stats.matched_bytes, 0);
}

TEST_F(SessionTests, IdenticalFilesAreMatched) {  // NOLINT
  auto data = GenerateData(70'000, 4);
  MemoryFileStore source;
  source.Put("same.bin", data);
  MemoryFileStore destination;
  destination.Put("same.bin", data);

  auto result = Transfer(source, destination);

  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(destination.Get("same.bin"), data);
  EXPECT_EQ(result.receiver.stats.literal_bytes, 0);
  EXPECT_EQ(result.receiver.stats.matched_bytes, 70'000);
}

TEST_F(SessionTests, EmptyFileList) {  // NOLINT
  MemoryFileStore source;
  MemoryFileStore destination;

  auto result = Transfer(source, destination);

  EXPECT_TRUE(result.sender.IsSuccess()) << result.sender;
  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_TRUE(result.receiver.completed.empty());
  EXPECT_EQ(result.receiver.stats.total_size, 0);
}

TEST_F(SessionTests, FixedSeed) {  // NOLINT
  MemoryFileStore source;
  source.Put("x", "x");
  MemoryFileStore destination;

  SessionConfig config;
  config.checksum_seed = 4242;
  auto result = Transfer(source, destination, config);

  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(result.sender_seed, 4242);
  EXPECT_EQ(result.receiver_seed, 4242);
}

TEST_F(SessionTests, SmallFramesAndShortChecksums) {  // NOLINT
  auto data = GenerateData(10'000, 5);
  auto basis = data;
  basis[5'000] = static_cast<char>(basis[5'000] + 1);

  MemoryFileStore source;
  source.Put("data.bin", data);
  MemoryFileStore destination;
  destination.Put("data.bin", basis);

  SessionConfig sender_config;
  sender_config.max_frame_payload = 64;
  sender_config.max_literal = 50;

  SessionConfig receiver_config;
  receiver_config.max_frame_payload = 64;
  receiver_config.strong_len = 2;
  receiver_config.block_size.fixed_block_len = 64;

  auto result = Transfer(source, destination, sender_config, receiver_config);

  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(destination.Get("data.bin"), data);
  EXPECT_EQ(result.receiver.stats.literal_bytes, 64);
}

TEST_F(SessionTests, VersionMismatchAbortsBothSides) {  // NOLINT
  MemoryFileStore source;
  source.Put("x", "x");
  MemoryFileStore destination;

  SessionConfig receiver_config;
  receiver_config.protocol_version = 26;

  auto result = Transfer(source, destination, {}, receiver_config);

  EXPECT_TRUE(result.sender.aborted);
  EXPECT_TRUE(result.receiver.aborted);
  EXPECT_EQ(result.sender_state, SessionState::kAborted);
  EXPECT_EQ(result.receiver_state, SessionState::kAborted);
  EXPECT_NE(result.receiver.abort_reason.find("version"), std::string::npos);
  EXPECT_FALSE(destination.Contains("x"));
}

TEST_F(SessionTests, FrameLimitViolationIsReportedToThePeer) {  // NOLINT
  MemoryFileStore source;
  for (int i = 0; i < 10; i++) {
    source.Put("some/longer/path/" + std::to_string(i), "data");
  }
  MemoryFileStore destination;

  SessionConfig receiver_config;
  receiver_config.max_frame_payload = 64;

  auto result = Transfer(source, destination, {}, receiver_config);

  EXPECT_TRUE(result.receiver.aborted);
  EXPECT_TRUE(result.sender.aborted);
  EXPECT_NE(result.sender.abort_reason.find("peer"), std::string::npos)
      << result.sender.abort_reason;
}

TEST_F(SessionTests, IntegrityFailureOnlyFailsThatFile) {  // NOLINT
  auto data = GenerateData(50'000, 6);
  auto basis = data;
  basis[100] = static_cast<char>(basis[100] + 1);

  MemoryFileStore source;
  source.Put("flip.bin", data);
  source.Put("ok.txt", "fine");
  FlippingStore destination;
  destination.Put("flip.bin", basis);

  auto result = Transfer(
      source,
      destination,
      {},
      {},
      [](TransferSession & /*sender*/, TransferSession &receiver) {
        ExpectationCheckMetricVisitor(
            receiver,
            {//
             {"//files_completed_", 1},
             {"//files_failed_", 1}});
      });

  EXPECT_FALSE(result.receiver.aborted);
  ExpectFailure(result.receiver, "flip.bin", FileErrorKind::kIntegrity);
  EXPECT_EQ(result.receiver.completed, std::vector<std::string>{"ok.txt"});
  EXPECT_EQ(destination.Get("flip.bin"), basis);
  EXPECT_EQ(destination.Get("ok.txt"), "fine");

  // the sender has no way of knowing
  EXPECT_TRUE(result.sender.IsSuccess()) << result.sender;
  EXPECT_EQ(result.sender.completed.size(), 2);
}

TEST_F(SessionTests, WholeFileChecksumIsVerified) {  // NOLINT
  auto good = StrongChecksum::Compute(0, "content2", 8).ToBytes();

  MemoryFileStore source;
  source.Put(
      {.path = "c.txt", .checksum = std::string(StrongChecksum::kSize, '\0')},
      "content");
  source.Put(
      {.path = "d.txt", .checksum = std::string(good.begin(), good.end())},
      "content2");
  MemoryFileStore destination;

  auto result = Transfer(source, destination);

  ExpectFailure(result.receiver, "c.txt", FileErrorKind::kIntegrity);
  EXPECT_FALSE(destination.Contains("c.txt"));
  EXPECT_EQ(destination.Get("d.txt"), "content2");
}

TEST_F(SessionTests, SenderReadFailure) {  // NOLINT
  FailingStore source;
  source.Put("bad.txt", "secret");
  source.Put("good.txt", "public");
  MemoryFileStore destination;

  auto result = Transfer(source, destination);

  EXPECT_FALSE(result.sender.aborted);
  EXPECT_FALSE(result.receiver.aborted);

  ExpectFailure(result.sender, "bad.txt", FileErrorKind::kIo);
  EXPECT_EQ(result.sender.completed, std::vector<std::string>{"good.txt"});

  ExpectFailure(result.receiver, "bad.txt", FileErrorKind::kSender);
  EXPECT_NE(
      result.receiver.failures[0].message.find("permission denied"),
      std::string::npos);
  EXPECT_EQ(result.receiver.completed, std::vector<std::string>{"good.txt"});
  EXPECT_FALSE(destination.Contains("bad.txt"));
  EXPECT_EQ(destination.Get("good.txt"), "public");
}

TEST_F(SessionTests, NonUtf8FileNames) {  // NOLINT
  MemoryFileStore source;
  // latin-1 bytes are a valid file name but not valid UTF-8
  source.Put("caf\xe9.txt", "latin-1 name");
  source.Put("plain.txt", "ok");
  MemoryFileStore destination;
  destination.Put("caf\xe9.txt", "latin-1 old");

  auto result = Transfer(source, destination);

  EXPECT_TRUE(result.sender.IsSuccess()) << result.sender;
  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(
      result.receiver.completed,
      (std::vector<std::string>{"caf\xe9.txt", "plain.txt"}));
  EXPECT_EQ(destination.Get("caf\xe9.txt"), "latin-1 name");
  EXPECT_EQ(destination.Get("plain.txt"), "ok");
}

TEST_F(SessionTests, InvalidCopyFromPeer) {  // NOLINT
  static constexpr uint32_t kSeed = 99;

  auto transports = CreateLocalPair(io_context_);
  auto &peer = *transports.first;

  std::thread thread([&peer] {
    HandshakeAsSender(peer, kSeed);
    FrameMultiplexer mux(peer, 32 * 1024);
    DataStream stream(mux);

    SendFileList(
        stream,
        {{.path = "a.bin", .size = 700}, {.path = "b.txt", .size = 5}});

    auto table = ExpectRequest(stream, 0, kSeed);
    EXPECT_EQ(table.GetBlockCount(), 0);
    SendFile(
        stream,
        0,
        {Instruction::Copy(99, 700), Instruction::End()},
        StrongChecksum());

    ExpectRequest(stream, 1, kSeed);
    SendFile(
        stream,
        1,
        {Instruction::Data("hello"), Instruction::End()},
        StrongChecksum::Compute(kSeed, "hello", 5));

    EXPECT_EQ(wire::ReadI32(stream), -1);
    wire::WriteI32(stream, -1);
    wire::WriteVarint(stream, 1);
    wire::WriteVarint(stream, 2);
    wire::WriteVarint(stream, 3);
    stream.Flush();
    EXPECT_EQ(wire::ReadI32(stream), -1);
    peer.Close();
  });

  MemoryFileStore destination;
  TransferSession receiver(
      Role::kReceiver,
      {},
      *transports.second,
      destination);
  auto report = receiver.Run();
  thread.join();

  EXPECT_FALSE(report.aborted) << report;
  EXPECT_EQ(receiver.GetSeed(), kSeed);
  ExpectFailure(report, "a.bin", FileErrorKind::kReconstruction);
  EXPECT_EQ(report.completed, std::vector<std::string>{"b.txt"});
  EXPECT_FALSE(destination.Contains("a.bin"));
  EXPECT_EQ(destination.Get("b.txt"), "hello");

  EXPECT_EQ(report.stats.bytes_read, 1);
  EXPECT_EQ(report.stats.bytes_written, 2);
  EXPECT_EQ(report.stats.total_size, 3);
}

TEST_F(SessionTests, ConnectionLossAbortsWithPartialResults) {  // NOLINT
  static constexpr uint32_t kSeed = 7;

  auto transports = CreateLocalPair(io_context_);
  auto &peer = *transports.first;

  std::thread thread([&peer] {
    HandshakeAsSender(peer, kSeed);
    FrameMultiplexer mux(peer, 32 * 1024);
    DataStream stream(mux);

    SendFileList(stream, {{.path = "f0", .size = 1}, {.path = "f1", .size = 1}});

    ExpectRequest(stream, 0, kSeed);
    SendFile(
        stream,
        0,
        {Instruction::Data("x"), Instruction::End()},
        StrongChecksum::Compute(kSeed, "x", 1));

    ExpectRequest(stream, 1, kSeed);
    peer.ShutdownSend();
    peer.Close();
  });

  MemoryFileStore destination;
  TransferSession receiver(
      Role::kReceiver,
      {},
      *transports.second,
      destination);
  auto report = receiver.Run();
  thread.join();

  EXPECT_TRUE(report.aborted);
  EXPECT_EQ(receiver.GetState(), SessionState::kAborted);
  EXPECT_EQ(report.completed, std::vector<std::string>{"f0"});
  EXPECT_EQ(destination.Get("f0"), "x");
  EXPECT_FALSE(destination.Contains("f1"));
}

TEST_F(SessionTests, UnsafePathInFileList) {  // NOLINT
  auto transports = CreateLocalPair(io_context_);
  auto &peer = *transports.first;

  std::string error;
  std::thread thread([&peer, &error] {
    HandshakeAsSender(peer, 1);
    FrameMultiplexer mux(peer, 32 * 1024);
    DataStream stream(mux);
    SendFileList(stream, {{.path = "../escape", .size = 1}});

    try {
      wire::ReadI32(stream);
    } catch (const RemoteError &e) {
      error = e.what();
    }
    peer.Close();
  });

  MemoryFileStore destination;
  TransferSession receiver(
      Role::kReceiver,
      {},
      *transports.second,
      destination);
  auto report = receiver.Run();
  thread.join();

  EXPECT_TRUE(report.aborted);
  EXPECT_NE(error.find("unsafe path"), std::string::npos) << error;
  EXPECT_TRUE(destination.List().empty());
}

TEST_F(SessionTests, KeepaliveBeforeHashingBasis) {  // NOLINT
  auto transports = CreateLocalPair(io_context_);
  auto &peer = *transports.first;

  std::vector<Frame> frames;
  std::thread thread([&peer, &frames] {
    HandshakeAsSender(peer, 5);
    FrameMultiplexer mux(peer, 32 * 1024);
    DataStream stream(mux);
    SendFileList(stream, {{.path = "old.txt", .size = 5}});

    frames.push_back(mux.Recv());
    frames.push_back(mux.Recv());
    peer.Close();
  });

  MemoryFileStore destination;
  destination.Put("old.txt", "stale");
  TransferSession receiver(
      Role::kReceiver,
      {},
      *transports.second,
      destination);
  auto report = receiver.Run();
  thread.join();

  EXPECT_TRUE(report.aborted);
  ASSERT_EQ(frames.size(), 2);
  EXPECT_EQ(frames[0], (Frame{Channel::kKeepalive, ""}));
  EXPECT_EQ(frames[1].channel, Channel::kData);
  // file index, then the signature of the basis
  EXPECT_EQ(frames[1].payload.substr(0, 4), std::string(4, '\0'));
  EXPECT_EQ(destination.Get("old.txt"), "stale");
}

TEST_F(SessionTests, LocalDirectories) {  // NOLINT
  auto a = GenerateData(300'000, 7);
  auto b = GenerateData(1'000, 8);

  WriteFile("src/a.bin", a);
  WriteFile("src/sub/b.txt", b);
  WriteFile("dst/a.bin", GenerateData(1'000, 9) + a.substr(1'000));

  LocalFileStore source(GetScratchPath() / "src", true);
  LocalFileStore destination(GetScratchPath() / "dst", true);

  auto result = Transfer(source, destination);

  EXPECT_TRUE(result.sender.IsSuccess()) << result.sender;
  EXPECT_TRUE(result.receiver.IsSuccess()) << result.receiver;
  EXPECT_EQ(ReadFile("dst/a.bin"), a);
  EXPECT_EQ(ReadFile("dst/sub/b.txt"), b);
  EXPECT_GT(result.receiver.stats.matched_bytes, 250'000);

  // same size, mtime, mode and checksum, no staging leftovers
  EXPECT_EQ(destination.List(), source.List());
}

class FileStoreTests : public Fixture {};

TEST_F(FileStoreTests, SafePaths) {  // NOLINT
  EXPECT_TRUE(FileStore::IsSafePath("a"));
  EXPECT_TRUE(FileStore::IsSafePath("a/b.txt"));
  EXPECT_TRUE(FileStore::IsSafePath("dir/.hidden"));
  EXPECT_TRUE(FileStore::IsSafePath("..."));

  EXPECT_FALSE(FileStore::IsSafePath(""));
  EXPECT_FALSE(FileStore::IsSafePath("/etc/passwd"));
  EXPECT_FALSE(FileStore::IsSafePath(".."));
  EXPECT_FALSE(FileStore::IsSafePath("."));
  EXPECT_FALSE(FileStore::IsSafePath("a/../../b"));
  EXPECT_FALSE(FileStore::IsSafePath("a//b"));
  EXPECT_FALSE(FileStore::IsSafePath("a/"));
}

TEST_F(FileStoreTests, StagedFilesAppearOnCommit) {  // NOLINT
  auto root = GetScratchPath() / "store";
  LocalFileStore store(root);

  {
    auto staged = store.CreateStaged({.path = "d/dropped.txt"});
    staged->Stream() << "never visible";
    EXPECT_FALSE(std::filesystem::exists(root / "d/dropped.txt"));
  }
  EXPECT_TRUE(store.List().empty());

  {
    auto staged = store.CreateStaged(
        {.path = "d/kept.txt", .mtime = 1'500'000'000, .mode = 0600});
    staged->Stream() << "visible";
    staged->Commit();
  }
  EXPECT_EQ(ReadFile("store/d/kept.txt"), "visible");

  auto entries = store.List();
  ASSERT_EQ(entries.size(), 1);
  EXPECT_EQ(entries[0].path, "d/kept.txt");
  EXPECT_EQ(entries[0].size, 7);
  EXPECT_EQ(entries[0].mtime, 1'500'000'000);
  EXPECT_EQ(entries[0].mode, 0600);
  EXPECT_TRUE(entries[0].checksum.empty());

  MemoryFileStore memory;
  {
    auto staged = memory.CreateStaged({.path = "m"});
    staged->Stream() << "dropped";
  }
  EXPECT_FALSE(memory.Contains("m"));
}

TEST_F(FileStoreTests, MissingFilesOpenAsNull) {  // NOLINT
  LocalFileStore store(GetScratchPath());
  EXPECT_EQ(store.OpenForRead("missing"), nullptr);

  WriteFile("present", "12345");
  auto reader = store.OpenForRead("present");
  ASSERT_NE(reader, nullptr);
  EXPECT_EQ(reader->GetSize(), 5);
}

}  // namespace rdsync
