/**
 * @file proxy_client.hpp
 * @brief Blocking client for the proxy gateway: job submission and the
 *        worker-update control request.
 *
 * A connection may carry several outstanding jobs; results come back in
 * completion order and are matched by correlation id.
 */

#ifndef PPX_PROXY_CLIENT_HPP_
#define PPX_PROXY_CLIENT_HPP_

#include "ppx/job.hpp"
#include "ppx/protocol.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"

#if PPX_HAS_NETWORK

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace ppx {

struct WorkerUpdateAck {
  ProxyError error = ProxyError::kNone;  ///< First per-address failure.
  uint32_t worker_count = 0;
};

class ProxyClient final {
 public:
  ProxyClient() = default;
  ProxyClient(ProxyClient&&) noexcept = default;
  ProxyClient& operator=(ProxyClient&&) noexcept = default;

  static expected<ProxyClient, SocketError> Connect(const char* address,
                                                    uint32_t timeout_ms) {
    auto addr = SocketAddress::Parse(address);
    if (!addr.has_value()) {
      return expected<ProxyClient, SocketError>::error(addr.get_error());
    }
    auto sock = TcpSocket::ConnectTo(addr.value(), timeout_ms);
    if (!sock.has_value()) {
      return expected<ProxyClient, SocketError>::error(sock.get_error());
    }
    ProxyClient c;
    c.sock_ = std::move(sock.value());
    return expected<ProxyClient, SocketError>::success(std::move(c));
  }

  /// @brief Bound every subsequent receive. 0 waits forever.
  expected<void, SocketError> SetReceiveTimeout(uint32_t timeout_ms) noexcept {
    return sock_.SetRecvTimeout(timeout_ms);
  }

  expected<void, FrameError> Send(uint64_t correlation_id, const Payload& payload) {
    return WriteFrame(sock_, MakeFrame(FrameType::kSubmit, correlation_id, payload));
  }

  /// @brief Next result on this connection, whichever job it belongs to.
  expected<ResultMessage, FrameError> ReceiveResult() {
    auto f = ReadFrame(sock_);
    if (!f.has_value()) {
      return expected<ResultMessage, FrameError>::error(f.get_error());
    }
    if (f.value().header.type != FrameType::kResult) {
      return expected<ResultMessage, FrameError>::error(FrameError::kBadType);
    }
    return expected<ResultMessage, FrameError>::success(DecodeResult(f.value()));
  }

  /// @brief Submit one job and wait for its outcome.
  expected<ResultMessage, FrameError> Submit(uint64_t correlation_id,
                                             const Payload& payload) {
    auto sent = Send(correlation_id, payload);
    if (!sent.has_value()) {
      return expected<ResultMessage, FrameError>::error(sent.get_error());
    }
    return ReceiveResult();
  }

  expected<WorkerUpdateAck, FrameError> UpdateWorkers(const WorkerUpdate& update) {
    auto sent = WriteFrame(
        sock_, MakeFrame(FrameType::kWorkerUpdate, 0, EncodeWorkerUpdate(update)));
    if (!sent.has_value()) {
      return expected<WorkerUpdateAck, FrameError>::error(sent.get_error());
    }
    auto f = ReadFrame(sock_);
    if (!f.has_value()) {
      return expected<WorkerUpdateAck, FrameError>::error(f.get_error());
    }
    if (f.value().header.type != FrameType::kWorkerUpdateAck) {
      return expected<WorkerUpdateAck, FrameError>::error(FrameError::kBadType);
    }
    WorkerUpdateAck ack;
    ack.error = f.value().header.error;
    ack.worker_count = static_cast<uint32_t>(
        std::strtoul(PayloadText(f.value().payload).c_str(), nullptr, 10));
    return expected<WorkerUpdateAck, FrameError>::success(ack);
  }

  void Close() noexcept { sock_.Close(); }
  bool IsConnected() const noexcept { return sock_.IsValid(); }

 private:
  TcpSocket sock_;
};

}  // namespace ppx

#endif  // PPX_HAS_NETWORK

#endif  // PPX_PROXY_CLIENT_HPP_
