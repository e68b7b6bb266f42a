/**
 * @file worker_transport.hpp
 * @brief How the proxy talks to workers: run a proving job, probe liveness.
 *
 * WorkerTransport is the seam between the dispatch core and the network.
 * TcpWorkerTransport opens one short-lived connection per call:
 *
 *   Prove: kProveRequest(id = JobId, payload) -> kProveResponse
 *          (error kNone + proof, or kWorkerError + message)
 *   Probe: kProbe -> kProbeAck
 */

#ifndef PPX_WORKER_TRANSPORT_HPP_
#define PPX_WORKER_TRANSPORT_HPP_

#include "ppx/job.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/protocol.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ppx {

struct TransportFailure {
  ProxyError code = ProxyError::kTransportError;
  std::string detail;
};

class WorkerTransport {
 public:
  virtual ~WorkerTransport() = default;

  /**
   * @brief Forward a job and wait for its proof.
   * @param timeout_ms Upper bound for the whole exchange.
   * @return Proof bytes, or the failure with kWorkerError, kJobTimeout or
   *         kTransportError.
   */
  virtual expected<Payload, TransportFailure> Prove(const char* address,
                                                    JobId job,
                                                    const Payload& payload,
                                                    uint32_t timeout_ms) = 0;

  /// @brief One liveness probe. False on error or timeout.
  virtual bool Probe(const char* address, uint32_t timeout_ms) = 0;

  /// @brief Abort calls in progress; they fail with kTransportError.
  virtual void CancelAll() {}
};

#if PPX_HAS_NETWORK

class TcpWorkerTransport final : public WorkerTransport {
 public:
  explicit TcpWorkerTransport(uint32_t connect_timeout_ms) noexcept
      : connect_timeout_ms_(connect_timeout_ms) {}

  expected<Payload, TransportFailure> Prove(const char* address, JobId job,
                                            const Payload& payload,
                                            uint32_t timeout_ms) override {
    auto sock = Open(address, std::min(connect_timeout_ms_, timeout_ms), timeout_ms);
    if (!sock.has_value()) {
      return expected<Payload, TransportFailure>::error(sock.get_error());
    }
    TcpSocket& s = sock.value();
    ActiveGuard guard(*this, s.Fd());

    Frame req = MakeFrame(FrameType::kProveRequest, job.value(), payload);
    auto w = WriteFrame(s, req);
    if (!w.has_value()) {
      return expected<Payload, TransportFailure>::error(
          Failure(w.get_error(), "send to", address));
    }
    auto resp = ReadFrame(s);
    if (!resp.has_value()) {
      return expected<Payload, TransportFailure>::error(
          Failure(resp.get_error(), "recv from", address));
    }
    Frame& f = resp.value();
    if (f.header.type != FrameType::kProveResponse || f.header.id != job.value()) {
      return expected<Payload, TransportFailure>::error(
          TransportFailure{ProxyError::kTransportError, "unexpected frame"});
    }
    if (f.header.error != ProxyError::kNone) {
      return expected<Payload, TransportFailure>::error(TransportFailure{
          ProxyError::kWorkerError, PayloadText(f.payload)});
    }
    return expected<Payload, TransportFailure>::success(std::move(f.payload));
  }

  bool Probe(const char* address, uint32_t timeout_ms) override {
    auto sock = Open(address, timeout_ms, timeout_ms);
    if (!sock.has_value()) return false;
    TcpSocket& s = sock.value();
    ActiveGuard guard(*this, s.Fd());

    if (!WriteFrame(s, MakeFrame(FrameType::kProbe, 0U)).has_value()) {
      return false;
    }
    auto resp = ReadFrame(s);
    return resp.has_value() && resp.value().header.type == FrameType::kProbeAck;
  }

  void CancelAll() override {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    for (int32_t fd : active_) (void)::shutdown(fd, SHUT_RDWR);
  }

 private:
  /// Tracks an in-progress call so CancelAll() can interrupt it.
  class ActiveGuard {
   public:
    ActiveGuard(TcpWorkerTransport& owner, int32_t fd) : owner_(owner), fd_(fd) {
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      owner_.active_.push_back(fd_);
      if (owner_.cancelled_) (void)::shutdown(fd_, SHUT_RDWR);
    }
    ~ActiveGuard() {
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      auto it = std::find(owner_.active_.begin(), owner_.active_.end(), fd_);
      if (it != owner_.active_.end()) owner_.active_.erase(it);
    }
    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

   private:
    TcpWorkerTransport& owner_;
    int32_t fd_;
  };

  /// Connect within connect_ms; every later send/recv is bounded by io_ms.
  expected<TcpSocket, TransportFailure> Open(const char* address,
                                             uint32_t connect_ms, uint32_t io_ms) {
    auto addr = SocketAddress::Parse(address);
    if (!addr.has_value()) {
      return expected<TcpSocket, TransportFailure>::error(TransportFailure{
          ProxyError::kTransportError, std::string("bad address ") + address});
    }
    auto sock = TcpSocket::ConnectTo(addr.value(), connect_ms);
    if (!sock.has_value()) {
      return expected<TcpSocket, TransportFailure>::error(TransportFailure{
          ProxyError::kTransportError,
          std::string("connect ") + address + ": " +
              SocketErrorToString(sock.get_error())});
    }
    if (!sock.value().SetSendTimeout(io_ms).has_value() ||
        !sock.value().SetRecvTimeout(io_ms).has_value()) {
      return expected<TcpSocket, TransportFailure>::error(TransportFailure{
          ProxyError::kTransportError, std::string("socket options ") + address});
    }
    return expected<TcpSocket, TransportFailure>::success(
        std::move(sock.value()));
  }

  static TransportFailure Failure(FrameError e, const char* what,
                                  const char* address) {
    TransportFailure f;
    f.code = (e == FrameError::kTimeout) ? ProxyError::kJobTimeout
                                         : ProxyError::kTransportError;
    f.detail = std::string(what) + " " + address + ": " + FrameErrorToString(e);
    return f;
  }

  uint32_t connect_timeout_ms_;
  std::mutex mutex_;
  std::vector<int32_t> active_;
  bool cancelled_ = false;
};

#endif  // PPX_HAS_NETWORK

}  // namespace ppx

#endif  // PPX_WORKER_TRANSPORT_HPP_
