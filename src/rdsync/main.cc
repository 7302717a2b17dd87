#include <gflags/gflags.h>
#include <glog/logging.h>
#include <rdsync/common/metric_callback_visitor.h>
#include <rdsync/common/noexcept.h>
#include <rdsync/session/file_store.h>
#include <rdsync/session/transfer_session.h>
#include <rdsync/transport/socket_transport.h>
#include <rdsync/wire/frame.h>

#include <boost/asio/io_context.hpp>

DEFINE_string(command, "", "send or receive");                      // NOLINT
DEFINE_string(root, ".", "directory to send from or receive into");  // NOLINT
DEFINE_string(host, "localhost", "host to connect to");              // NOLINT
DEFINE_uint32(port, 8730, "tcp port");                               // NOLINT
DEFINE_bool(listen, false, "accept a connection instead of connecting");  // NOLINT
DEFINE_uint32(block_size, 0, "block length, 0 picks it from the file size");  // NOLINT
DEFINE_uint32(strong_len, 16, "strong checksum bytes per block");  // NOLINT
DEFINE_uint32(checksum_seed, 0, "checksum seed, 0 for random");    // NOLINT
DEFINE_int32(max_literal, 32 * 1024, "longest literal run");       // NOLINT
DEFINE_int32(max_frame_payload, 32 * 1024, "longest frame payload");  // NOLINT
DEFINE_bool(checksum, false, "send whole file checksums in the file list");  // NOLINT

DECLARE_bool(help);
DECLARE_string(helpon);

int handleHelpFlags(int argc);

int main(int argc, char **argv) {
  return rdsync::NoExcept([&argc, &argv]() {
    google::InitGoogleLogging(argv[0]);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;
    FLAGS_colorlogtostderr = true;

    gflags::SetUsageMessage("rdsync");
    gflags::SetVersionString("v0.1");

    rdsync::Role role;
    if (FLAGS_command == "send") {
      role = rdsync::Role::kSender;
    } else if (FLAGS_command == "receive") {
      role = rdsync::Role::kReceiver;
    } else {
      return handleHelpFlags(argc);
    }

    CHECK_LE(FLAGS_port, 65535U) << "invalid port";
    CHECK(FLAGS_strong_len > 0 && FLAGS_strong_len <= 16)
        << "strong_len must be within [1, 16]";
    CHECK_GT(FLAGS_max_literal, 0);
    CHECK(FLAGS_max_frame_payload > 0 &&
          FLAGS_max_frame_payload <= rdsync::kMaxFramePayload)
        << "invalid max_frame_payload";

    rdsync::SessionConfig config;
    config.block_size.fixed_block_len = FLAGS_block_size;
    config.strong_len = static_cast<uint8_t>(FLAGS_strong_len);
    config.checksum_seed = FLAGS_checksum_seed;
    config.max_literal = FLAGS_max_literal;
    config.max_frame_payload = FLAGS_max_frame_payload;

    rdsync::LocalFileStore store(FLAGS_root, FLAGS_checksum);

    boost::asio::io_context io_context;
    auto port = static_cast<uint16_t>(FLAGS_port);
    auto transport = FLAGS_listen
                         ? rdsync::AcceptTcp(io_context, port)
                         : rdsync::ConnectTcp(io_context, FLAGS_host, port);

    rdsync::TransferSession session(role, config, *transport, store);
    auto report = session.Run();

    rdsync::metrics::LogMetrics("rdsync", session);

    return report.IsSuccess() ? 0 : 1;
  });
}

int handleHelpFlags(int argc) {
  if (argc > 1) {
    LOG(ERROR) << "unhandled command";
  }

  // Just print out rdsync gflags
  FLAGS_help = false;
  FLAGS_helpon = "main";
  gflags::HandleCommandLineHelpFlags();
  if (argc > 1) {
    return 1;
  }
  return 0;
}
