#ifndef RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_TRANSFER_SESSION_H
#define RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_TRANSFER_SESSION_H

#include <rdsync/common/metrics.h>
#include <rdsync/session/file_store.h>
#include <rdsync/session/session_config.h>
#include <rdsync/session/transfer_report.h>
#include <rdsync/transport/data_stream.h>
#include <rdsync/transport/frame_multiplexer.h>
#include <rdsync/transport/transport.h>

#include <memory>
#include <ostream>
#include <vector>

namespace rdsync {

enum class Role {
  kSender,
  kReceiver,
};

enum class SessionState {
  kHandshake,
  kFileListExchange,
  kSignatureExchange,
  kDeltaCompute,
  kInstructionExchange,
  kReconstruct,
  kVerify,
  kClose,
  kClosed,
  kAborted,
};

const char *ToString(Role role);
const char *ToString(SessionState state);

std::ostream &operator<<(std::ostream &os, SessionState state);

/**
 * One side of a transfer over a single connection.
 *
 * The sender owns the source files and the receiver the destination. The
 * receiver drives the per file exchange: it asks for a file by index and
 * sends the signature of its basis; the sender answers with instructions
 * and the digest of the source. Files go one at a time.
 *
 * Errors scoped to one file end up in the report and the session moves on;
 * anything else aborts the session and is reported to the peer on the
 * Error channel when the framing still works.
 */
class TransferSession final : public metrics::MetricContainer {
  Role role_;
  SessionConfig config_;
  Transport &transport_;
  FileStore &store_;

  SessionState state_{SessionState::kHandshake};
  uint32_t seed_{};
  bool ran_{};

  std::unique_ptr<FrameMultiplexer> mux_;
  std::unique_ptr<DataStream> stream_;

  std::vector<FileEntry> files_;
  TransferReport report_;

  metrics::Metric files_completed_{};
  metrics::Metric files_failed_{};
  metrics::Metric literal_bytes_{};
  metrics::Metric matched_bytes_{};

  void SetState(SessionState state);

  void Handshake();

  void SendFileList();
  void ReceiveFileList();

  void RunSender();
  void SendFile(int32_t index);
  void SendStatistics();

  void RunReceiver();
  void ReceiveFile(int32_t index);
  void ReceiveStatistics();

  void Close();

  void RecordFailure(
      const std::string &path,
      FileErrorKind kind,
      const std::string &message);

  void Abort(const std::string &reason);

public:
  TransferSession(
      Role role,
      SessionConfig config,
      Transport &transport,
      FileStore &store);

  /**
   * runs the whole session; can be called once.
   * never throws for conditions the protocol defines, they end up in the
   * report instead.
   */
  TransferReport Run();

  [[nodiscard]] SessionState GetState() const;

  // 0 until the handshake is done
  [[nodiscard]] uint32_t GetSeed() const;

  void Accept(metrics::MetricVisitor &visitor) override;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_TRANSFER_SESSION_H
