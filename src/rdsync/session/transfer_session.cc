#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/common/timer.h>
#include <rdsync/delta/delta_matcher.h>
#include <rdsync/delta/reconstructor.h>
#include <rdsync/session/transfer_session.h>
#include <rdsync/signature/block_size.h>
#include <rdsync/wire/byte_io.h>
#include <rdsync/wire/frame.h>
#include <rdsync/wire/instruction_codec.h>
#include <rdsync/wire/signature_codec.h>

#include "pb/file_list_adapter.h"

#include <algorithm>
#include <optional>
#include <random>

namespace rdsync {

namespace {

constexpr int32_t kEndOfPhase = -1;

StrongChecksum ReadDigest(ByteSource &source) {
  StrongChecksum::Bytes bytes;
  source.ReadExact(bytes.data(), StrongChecksum::kSize);
  return StrongChecksum::FromBytes(bytes);
}

void WriteDigest(ByteSink &sink, const StrongChecksum &digest) {
  auto bytes = digest.ToBytes();
  wire::WriteBytes(sink, bytes.data(), StrongChecksum::kSize);
}

}  // namespace

const char *ToString(Role role) {
  switch (role) {
    case Role::kSender:
      return "sender";
    case Role::kReceiver:
      return "receiver";
  }
  return "unknown";
}

const char *ToString(SessionState state) {
  switch (state) {
    case SessionState::kHandshake:
      return "handshake";
    case SessionState::kFileListExchange:
      return "file_list_exchange";
    case SessionState::kSignatureExchange:
      return "signature_exchange";
    case SessionState::kDeltaCompute:
      return "delta_compute";
    case SessionState::kInstructionExchange:
      return "instruction_exchange";
    case SessionState::kReconstruct:
      return "reconstruct";
    case SessionState::kVerify:
      return "verify";
    case SessionState::kClose:
      return "close";
    case SessionState::kClosed:
      return "closed";
    case SessionState::kAborted:
      return "aborted";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, SessionState state) {
  return os << ToString(state);
}

TransferSession::TransferSession(
    Role role,
    SessionConfig config,
    Transport &transport,
    FileStore &store)
    : role_(role),
      config_(config),
      transport_(transport),
      store_(store) {
  CHECK(config_.strong_len > 0 && config_.strong_len <= StrongChecksum::kSize)
      << "invalid strong_len " << static_cast<int>(config_.strong_len);
  CHECK_GT(config_.max_literal, 0);
}

void TransferSession::SetState(SessionState state) {
  VLOG(1) << ToString(role_) << ": " << state_ << " -> " << state;
  state_ = state;
}

void TransferSession::Handshake() {
  SetState(SessionState::kHandshake);

  StringSink version;
  wire::WriteI32(version, config_.protocol_version);
  transport_.WriteAll(
      version.GetData().data(),
      static_cast<std::streamsize>(version.GetData().size()));

  std::string peer(4, '\0');
  transport_.ReadExact(peer.data(), 4);
  StringSource peer_source(peer);
  auto peer_version = wire::ReadI32(peer_source);

  if (peer_version != config_.protocol_version) {
    throw ProtocolError(
        "protocol version mismatch: local " +
        std::to_string(config_.protocol_version) + " remote " +
        std::to_string(peer_version));
  }

  if (role_ == Role::kSender) {
    seed_ = config_.checksum_seed;
    if (seed_ == 0) {
      std::random_device device;
      seed_ = device();
    }
    StringSink seed;
    wire::WriteU32(seed, seed_);
    transport_.WriteAll(
        seed.GetData().data(),
        static_cast<std::streamsize>(seed.GetData().size()));
  } else {
    std::string seed(4, '\0');
    transport_.ReadExact(seed.data(), 4);
    StringSource seed_source(seed);
    seed_ = wire::ReadU32(seed_source);
  }

  LOG(INFO) << ToString(role_) << ": protocol " << peer_version << " seed "
            << seed_;
}

void TransferSession::SendFileList() {
  SetState(SessionState::kFileListExchange);

  files_ = store_.List();
  auto data = FileListAdapter::Serialize(files_);

  wire::WriteVarint(*stream_, data.size());
  wire::WriteBytes(
      *stream_,
      data.data(),
      static_cast<std::streamsize>(data.size()));
  stream_->Flush();

  LOG(INFO) << "sent list of " << files_.size() << " files";
}

void TransferSession::ReceiveFileList() {
  SetState(SessionState::kFileListExchange);

  auto size = wire::ReadVarint(*stream_);
  if (size > static_cast<uint64_t>(config_.max_file_list_bytes)) {
    throw ProtocolError(
        "file list of " + std::to_string(size) + " bytes exceeds limit of " +
        std::to_string(config_.max_file_list_bytes));
  }
  files_ = FileListAdapter::Parse(
      wire::ReadBytes(*stream_, static_cast<std::streamsize>(size)));

  for (const auto &entry : files_) {
    if (!FileStore::IsSafePath(entry.path)) {
      throw ProtocolError("unsafe path in file list: " + entry.path);
    }
    if (!entry.checksum.empty() &&
        entry.checksum.size() != StrongChecksum::kSize) {
      throw ProtocolError("malformed checksum for " + entry.path);
    }
  }

  LOG(INFO) << "received list of " << files_.size() << " files";
}

void TransferSession::RunSender() {
  SendFileList();

  while (true) {
    SetState(SessionState::kSignatureExchange);
    auto index = wire::ReadI32(*stream_);
    if (index == kEndOfPhase) {
      break;
    }
    if (index < 0 || index >= static_cast<int32_t>(files_.size())) {
      throw ProtocolError("file index " + std::to_string(index) + " out of range");
    }
    SendFile(index);
  }

  SendStatistics();

  auto goodbye = wire::ReadI32(*stream_);
  if (goodbye != kEndOfPhase) {
    throw ProtocolError("unexpected " + std::to_string(goodbye) + " at close");
  }
}

void TransferSession::SendFile(int32_t index) {
  const auto &entry = files_[index];

  auto table = wire::ReadSignature(*stream_, seed_, config_.max_block_count);
  VLOG(1) << "sending " << entry.path << " against " << table.GetBlockCount()
          << " blocks of " << table.GetBlockLength();

  wire::WriteI32(*stream_, index);

  SetState(SessionState::kDeltaCompute);

  metrics::MetricValueType literal_bytes = 0;
  metrics::MetricValueType matched_bytes = 0;

  try {
    auto reader = store_.OpenForRead(entry.path);
    if (!reader) {
      throw IoError(entry.path + " no longer exists");
    }

    SetState(SessionState::kInstructionExchange);

    DeltaMatcher matcher(table, config_.max_literal);
    matcher.Run(*reader, [&](const Instruction &instruction) {
      if (instruction.kind == Instruction::Kind::kData) {
        literal_bytes += static_cast<metrics::MetricValueType>(
            instruction.data.size());
      } else if (instruction.kind == Instruction::Kind::kCopy) {
        matched_bytes += instruction.byte_len;
      }
      wire::WriteInstruction(*stream_, instruction);
    });
    WriteDigest(*stream_, matcher.GetDigest());
    stream_->Flush();

    report_.stats.total_size += reader->GetSize();
    report_.completed.push_back(entry.path);
    files_completed_++;
  } catch (const IoError &e) {
    // whatever went out stays valid, terminate the stream and let the
    // receiver drop the file
    stream_->SendMessage(Channel::kErrorXfer, entry.path + ": " + e.what());
    wire::WriteInstruction(*stream_, Instruction::End());
    WriteDigest(*stream_, StrongChecksum());
    stream_->Flush();

    RecordFailure(entry.path, FileErrorKind::kIo, e.what());
  }

  literal_bytes_ += literal_bytes;
  matched_bytes_ += matched_bytes;
  report_.stats.literal_bytes += literal_bytes;
  report_.stats.matched_bytes += matched_bytes;
}

void TransferSession::SendStatistics() {
  SetState(SessionState::kClose);

  report_.stats.bytes_read = mux_->GetBytesReceived();
  report_.stats.bytes_written = mux_->GetBytesSent();

  wire::WriteI32(*stream_, kEndOfPhase);
  wire::WriteVarint(*stream_, report_.stats.bytes_read);
  wire::WriteVarint(*stream_, report_.stats.bytes_written);
  wire::WriteVarint(*stream_, report_.stats.total_size);
  stream_->Flush();
}

void TransferSession::RunReceiver() {
  ReceiveFileList();

  for (int32_t index = 0; index < static_cast<int32_t>(files_.size());
       index++) {
    ReceiveFile(index);
  }

  SetState(SessionState::kClose);
  wire::WriteI32(*stream_, kEndOfPhase);
  stream_->Flush();

  ReceiveStatistics();

  wire::WriteI32(*stream_, kEndOfPhase);
  stream_->Flush();
}

void TransferSession::ReceiveFile(int32_t index) {
  const auto &entry = files_[index];

  SetState(SessionState::kSignatureExchange);

  std::unique_ptr<Reader> basis;
  std::optional<SignatureTable> table;
  try {
    basis = store_.OpenForRead(entry.path);
    if (basis) {
      // the peer hears nothing while a large basis is hashed
      stream_->SendKeepalive();
      table = SignatureTable::Build(
          *basis,
          ChooseBlockLength(basis->GetSize(), config_.block_size),
          seed_,
          config_.strong_len);
    }
  } catch (const IoError &e) {
    LOG(WARNING) << "ignoring unreadable basis " << entry.path << ": "
                 << e.what();
    basis.reset();
  }
  if (!basis) {
    table.emplace(
        seed_,
        ChooseBlockLength(0, config_.block_size),
        0,
        config_.strong_len,
        std::vector<Block>());
  }

  wire::WriteI32(*stream_, index);
  wire::WriteSignature(*stream_, *table);
  stream_->Flush();

  SetState(SessionState::kInstructionExchange);
  auto echo = wire::ReadI32(*stream_);
  if (echo != index) {
    throw ProtocolError(
        "expected file " + std::to_string(index) + " got " +
        std::to_string(echo));
  }

  // declared first so the reconstructor goes before its output
  std::unique_ptr<StagedFile> staged;
  std::unique_ptr<Reconstructor> reconstructor;
  std::optional<FileFailure> failure;

  try {
    staged = store_.CreateStaged(entry);
    reconstructor =
        std::make_unique<Reconstructor>(*table, basis.get(), staged->Stream());
    if (!entry.checksum.empty()) {
      reconstructor->TrackUnseededDigest();
    }
  } catch (const IoError &e) {
    failure = {entry.path, FileErrorKind::kIo, e.what()};
  }

  SetState(SessionState::kReconstruct);

  metrics::MetricValueType literal_bytes = 0;
  metrics::MetricValueType matched_bytes = 0;

  // keeps consuming after a failure so the stream stays in step
  while (true) {
    auto instruction = wire::ReadInstruction(*stream_, kMaxFramePayload);
    if (!failure) {
      try {
        reconstructor->Apply(instruction);
        if (instruction.kind == Instruction::Kind::kData) {
          literal_bytes += static_cast<metrics::MetricValueType>(
              instruction.data.size());
        } else if (instruction.kind == Instruction::Kind::kCopy) {
          matched_bytes += instruction.byte_len;
        }
      } catch (const ReconstructionError &e) {
        failure = {entry.path, FileErrorKind::kReconstruction, e.what()};
      } catch (const IoError &e) {
        failure = {entry.path, FileErrorKind::kIo, e.what()};
      }
    }
    if (instruction.kind == Instruction::Kind::kEnd) {
      break;
    }
  }
  auto digest = ReadDigest(*stream_);

  literal_bytes_ += literal_bytes;
  matched_bytes_ += matched_bytes;
  report_.stats.literal_bytes += literal_bytes;
  report_.stats.matched_bytes += matched_bytes;

  SetState(SessionState::kVerify);

  auto transfer_errors = stream_->TakeTransferErrors();
  if (!transfer_errors.empty()) {
    failure = {entry.path, FileErrorKind::kSender, transfer_errors.front()};
  }

  if (!failure) {
    try {
      reconstructor->Verify(digest);
      if (reconstructor->GetWrittenSize() != entry.size) {
        throw IntegrityError(
            "size mismatch: expected " + std::to_string(entry.size) +
            " got " + std::to_string(reconstructor->GetWrittenSize()));
      }
      if (!entry.checksum.empty()) {
        auto bytes = reconstructor->GetUnseededDigest().ToBytes();
        if (entry.checksum != std::string(bytes.begin(), bytes.end())) {
          throw IntegrityError("whole file checksum mismatch");
        }
      }
      reconstructor.reset();
      staged->Commit();
    } catch (const IntegrityError &e) {
      failure = {entry.path, FileErrorKind::kIntegrity, e.what()};
    } catch (const IoError &e) {
      failure = {entry.path, FileErrorKind::kIo, e.what()};
    }
  }

  if (failure) {
    RecordFailure(failure->path, failure->kind, failure->message);
    return;
  }

  VLOG(1) << "received " << entry.path << " literal=" << literal_bytes
          << " matched=" << matched_bytes;
  report_.completed.push_back(entry.path);
  files_completed_++;
}

void TransferSession::ReceiveStatistics() {
  auto marker = wire::ReadI32(*stream_);
  if (marker != kEndOfPhase) {
    throw ProtocolError(
        "expected end of files, got " + std::to_string(marker));
  }
  report_.stats.bytes_read = static_cast<int64_t>(wire::ReadVarint(*stream_));
  report_.stats.bytes_written =
      static_cast<int64_t>(wire::ReadVarint(*stream_));
  report_.stats.total_size = static_cast<int64_t>(wire::ReadVarint(*stream_));
}

void TransferSession::Close() {
  stream_->Flush();
  transport_.ShutdownSend();
  transport_.Close();
  SetState(SessionState::kClosed);
}

void TransferSession::RecordFailure(
    const std::string &path,
    FileErrorKind kind,
    const std::string &message) {
  LOG(WARNING) << ToString(role_) << ": " << path << " failed ("
               << ToString(kind) << "): " << message;
  report_.failures.push_back({path, kind, message});
  files_failed_++;
}

void TransferSession::Abort(const std::string &reason) {
  LOG(ERROR) << ToString(role_) << ": session aborted in " << state_ << ": "
             << reason;
  report_.aborted = true;
  report_.abort_reason = reason;
  SetState(SessionState::kAborted);
  transport_.ShutdownSend();
  transport_.Close();
}

TransferReport TransferSession::Run() {
  CHECK(!ran_) << "session already ran";
  ran_ = true;

  timer::Stopwatch stopwatch;

  try {
    Handshake();

    mux_ = std::make_unique<FrameMultiplexer>(
        transport_,
        config_.max_frame_payload);
    stream_ = std::make_unique<DataStream>(*mux_);

    if (role_ == Role::kSender) {
      RunSender();
    } else {
      RunReceiver();
    }

    Close();
  } catch (const RemoteError &e) {
    Abort(std::string("peer aborted: ") + e.what());
  } catch (const TransportError &e) {
    Abort(e.what());
  } catch (const Error &e) {
    if (stream_) {
      try {
        stream_->SendMessage(Channel::kError, e.what());
      } catch (const TransportError &send_error) {
        LOG(WARNING) << "cannot report the error to the peer: "
                     << send_error.what();
      }
    }
    Abort(e.what());
  }

  LOG(INFO) << ToString(role_) << " finished in " << stopwatch.ElapsedMs()
            << "ms: " << report_;
  return report_;
}

SessionState TransferSession::GetState() const { return state_; }

uint32_t TransferSession::GetSeed() const { return seed_; }

void TransferSession::Accept(metrics::MetricVisitor &visitor) {
  RDSYNC_VISIT_METRIC(files_completed_);
  RDSYNC_VISIT_METRIC(files_failed_);
  RDSYNC_VISIT_METRIC(literal_bytes_);
  RDSYNC_VISIT_METRIC(matched_bytes_);
  if (mux_) {
    visitor.Visit("mux", *mux_);
  }
}

}  // namespace rdsync
