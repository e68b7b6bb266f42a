/**
 * @file proxy_server.hpp
 * @brief Listening gateway: accepts clients, admits their jobs into the
 *        Dispatcher and streams terminal outcomes back.
 *
 * Each accepted connection gets a ClientSession (the ResultSink for every
 * job it submits) and a handler thread that reads frames:
 *
 *   kSubmit       -> rate limit, Dispatcher::Submit(); a rejection is
 *                    answered immediately with a kResult frame
 *   kWorkerUpdate -> add/remove workers, answered with kWorkerUpdateAck
 *
 * Outcomes arrive on the session from whichever thread finished the job;
 * writes are serialized by the session mutex. When the client goes away
 * the session is marked disconnected and later outcomes are discarded by
 * the ResultRelay. In-flight jobs are not cancelled.
 */

#ifndef PPX_PROXY_SERVER_HPP_
#define PPX_PROXY_SERVER_HPP_

#include "ppx/dispatcher.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/protocol.hpp"
#include "ppx/result_relay.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"

#if PPX_HAS_NETWORK

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ppx {

// ============================================================================
// RateLimiter
// ============================================================================

/**
 * @brief Fixed one-second window request counter per client IPv4 address.
 *
 * A limit of 0 disables limiting. Counters of clients idle for a whole
 * window are dropped when the next window opens.
 */
class RateLimiter final {
 public:
  explicit RateLimiter(uint32_t max_per_sec) noexcept
      : max_per_sec_(max_per_sec) {}

  bool Allow(uint32_t client_ip, uint64_t now_ms) {
    if (max_per_sec_ == 0U) return true;
    const uint64_t window = now_ms / 1000U;
    std::lock_guard<std::mutex> lock(mutex_);
    if (window > current_window_) {
      current_window_ = window;
      for (auto it = windows_.begin(); it != windows_.end();) {
        if (it->second.second < window) {
          it = windows_.erase(it);
        } else {
          ++it;
        }
      }
    }
    Window& w = windows_[client_ip];
    if (w.second < window) {
      w.second = window;
      w.count = 0;
    }
    if (w.count >= max_per_sec_) return false;
    ++w.count;
    return true;
  }

  /// Number of client addresses with a live counter.
  uint32_t TrackedClients() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(windows_.size());
  }

 private:
  struct Window {
    uint64_t second = 0;
    uint32_t count = 0;
  };

  uint32_t max_per_sec_;
  uint64_t current_window_ = 0;
  std::mutex mutex_;
  std::map<uint32_t, Window> windows_;
};

// ============================================================================
// ClientSession
// ============================================================================

class ClientSession final : public ResultSink {
 public:
  ClientSession(TcpSocket sock, const SocketAddress& peer)
      : sock_(std::move(sock)), peer_(peer) {}

  bool IsConnected() const override {
    return connected_.load(std::memory_order_acquire);
  }

  bool Deliver(const JobOutcome& outcome) override {
    return Send(EncodeOutcome(outcome));
  }

  /**
   * @brief Write one frame. Bounded by the socket's send timeout.
   *
   * A failed or timed-out write may leave a partial frame on the stream,
   * so the session is disconnected and later sends fail immediately.
   */
  bool Send(const Frame& f) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!connected_.load(std::memory_order_acquire)) return false;
    auto w = WriteFrame(sock_, f);
    if (!w.has_value()) {
      char peer_text[kAddressStringSize];
      peer_.ToString(peer_text, sizeof(peer_text));
      PPX_LOG_WARN("SERVER", "write to %s failed: %s, dropping client",
                   peer_text, FrameErrorToString(w.get_error()));
      Disconnect();
      return false;
    }
    return true;
  }

  expected<Frame, FrameError> Receive() { return ReadFrame(sock_); }

  /// @brief Mark the client gone and wake a blocked Receive().
  void Disconnect() {
    connected_.store(false, std::memory_order_release);
    sock_.Shutdown();
  }

  const SocketAddress& Peer() const noexcept { return peer_; }

 private:
  TcpSocket sock_;
  SocketAddress peer_;
  std::mutex write_mutex_;
  std::atomic<bool> connected_{true};
};

// ============================================================================
// ProxyServer
// ============================================================================

enum class ServerError : uint8_t { kAlreadyRunning = 0, kBindFailed };

struct ProxyServerConfig {
  uint32_t max_connections = 64;
  uint32_t max_req_per_sec = 5;     ///< Per client address, 0 = unlimited.
  uint32_t send_timeout_ms = 5000;  ///< Per result write to a client.
};

struct ServerStats {
  uint64_t connections_accepted{0U};
  uint64_t connections_refused{0U};
  uint64_t rate_limited{0U};
  uint64_t admission_rejected{0U};
  uint64_t worker_updates{0U};
};

class ProxyServer final {
 public:
  ProxyServer(Dispatcher& dispatcher, const ProxyServerConfig& cfg)
      : dispatcher_(dispatcher), cfg_(cfg), limiter_(cfg.max_req_per_sec) {}

  ~ProxyServer() { Stop(); }

  ProxyServer(const ProxyServer&) = delete;
  ProxyServer& operator=(const ProxyServer&) = delete;

  expected<void, ServerError> Start(const SocketAddress& addr) {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, ServerError>::error(ServerError::kAlreadyRunning);
    }
    auto l = TcpListener::Bind(addr);
    if (!l.has_value()) {
      PPX_LOG_ERROR("SERVER", "bind failed: %s",
                    SocketErrorToString(l.get_error()));
      return expected<void, ServerError>::error(ServerError::kBindFailed);
    }
    listener_ = std::move(l.value());
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    PPX_LOG_INFO("SERVER", "proxy listening on port %u",
                 static_cast<unsigned>(listener_.LocalPort()));
    return expected<void, ServerError>::success();
  }

  void Stop() {
    if (!running_.exchange(false)) return;
    listener_.Shutdown();
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.Close();

    std::vector<Entry> entries;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      entries.swap(entries_);
    }
    for (Entry& e : entries) e.session->Disconnect();
    for (Entry& e : entries) {
      if (e.thread.joinable()) e.thread.join();
    }
    PPX_LOG_INFO("SERVER", "proxy stopped");
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint16_t Port() const noexcept { return listener_.LocalPort(); }

  uint32_t ActiveConnections() const noexcept {
    return active_.load(std::memory_order_relaxed);
  }

  ServerStats GetStats() const noexcept {
    ServerStats s;
    s.connections_accepted = accepted_.load(std::memory_order_relaxed);
    s.connections_refused = refused_.load(std::memory_order_relaxed);
    s.rate_limited = rate_limited_.load(std::memory_order_relaxed);
    s.admission_rejected = admission_rejected_.load(std::memory_order_relaxed);
    s.worker_updates = worker_updates_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  struct Entry {
    std::thread thread;
    std::shared_ptr<ClientSession> session;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void ReapFinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < entries_.size();) {
      if (entries_[i].finished->load(std::memory_order_acquire)) {
        if (entries_[i].thread.joinable()) entries_[i].thread.join();
        entries_[i] = std::move(entries_.back());
        entries_.pop_back();
      } else {
        ++i;
      }
    }
  }

  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      ReapFinished();
      SocketAddress peer;
      auto conn = listener_.Accept(peer);
      if (!conn.has_value()) {
        if (!running_.load(std::memory_order_acquire)) break;
        continue;
      }
      if (active_.load(std::memory_order_relaxed) >= cfg_.max_connections) {
        refused_.fetch_add(1U, std::memory_order_relaxed);
        PPX_LOG_WARN("SERVER", "connection refused: %u clients connected",
                     active_.load(std::memory_order_relaxed));
        continue;
      }
      if (!conn.value().SetSendTimeout(cfg_.send_timeout_ms).has_value()) {
        PPX_LOG_WARN("SERVER", "cannot set send timeout, connection dropped");
        continue;
      }
      accepted_.fetch_add(1U, std::memory_order_relaxed);
      active_.fetch_add(1U, std::memory_order_relaxed);

      auto session = std::make_shared<ClientSession>(std::move(conn.value()), peer);
      auto finished = std::make_shared<std::atomic<bool>>(false);
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.push_back(Entry{std::thread([this, session, finished]() {
                                 HandleSession(session);
                                 session->Disconnect();
                                 active_.fetch_sub(1U, std::memory_order_relaxed);
                                 finished->store(true, std::memory_order_release);
                               }),
                               session, finished});
    }
  }

  void HandleSession(const std::shared_ptr<ClientSession>& session) {
    char peer_text[kAddressStringSize];
    session->Peer().ToString(peer_text, sizeof(peer_text));
    PPX_LOG_DEBUG("SERVER", "client %s connected", peer_text);

    while (running_.load(std::memory_order_acquire)) {
      auto req = session->Receive();
      if (!req.has_value()) {
        if (req.get_error() != FrameError::kPeerClosed) {
          PPX_LOG_DEBUG("SERVER", "client %s: %s", peer_text,
                        FrameErrorToString(req.get_error()));
        }
        break;
      }
      Frame& f = req.value();
      if (f.header.type == FrameType::kSubmit) {
        HandleSubmit(session, f);
      } else if (f.header.type == FrameType::kWorkerUpdate) {
        if (!HandleWorkerUpdate(*session, f)) break;
      } else {
        PPX_LOG_WARN("SERVER", "client %s sent unexpected frame type %u",
                     peer_text, static_cast<unsigned>(f.header.type));
        break;
      }
    }
    PPX_LOG_DEBUG("SERVER", "client %s disconnected", peer_text);
  }

  void HandleSubmit(const std::shared_ptr<ClientSession>& session, Frame& f) {
    const uint64_t correlation_id = f.header.id;
    if (!limiter_.Allow(session->Peer().Ipv4(), SteadyNowMs())) {
      rate_limited_.fetch_add(1U, std::memory_order_relaxed);
      (void)session->Send(Rejection(correlation_id, "rate limit exceeded"));
      return;
    }
    auto r = dispatcher_.Submit(correlation_id, std::move(f.payload), session);
    if (!r.has_value()) {
      admission_rejected_.fetch_add(1U, std::memory_order_relaxed);
      (void)session->Send(Rejection(correlation_id, "too many requests in the queue"));
    }
  }

  bool HandleWorkerUpdate(ClientSession& session, const Frame& f) {
    worker_updates_.fetch_add(1U, std::memory_order_relaxed);
    Frame ack = MakeFrame(FrameType::kWorkerUpdateAck, f.header.id);
    optional<WorkerUpdate> update = ParseWorkerUpdate(f.payload);
    if (!update.has_value()) {
      ack.header.error = ProxyError::kInvalidAddress;
    } else {
      for (const std::string& addr : update.value().addresses) {
        ProxyError err = ProxyError::kNone;
        if (update.value().action == WorkerUpdateAction::kAdd) {
          auto r = dispatcher_.AddWorker(addr.c_str());
          if (!r.has_value()) err = r.get_error();
        } else {
          auto r = dispatcher_.RemoveWorkerByAddress(addr.c_str());
          if (!r.has_value()) err = r.get_error();
        }
        if (err != ProxyError::kNone) {
          PPX_LOG_WARN("SERVER", "worker update %s failed: %s", addr.c_str(),
                       ProxyErrorToString(err));
          if (ack.header.error == ProxyError::kNone) ack.header.error = err;
        }
      }
    }
    ack.payload = TextPayload(std::to_string(dispatcher_.WorkerCount()));
    return session.Send(ack);
  }

  static Frame Rejection(uint64_t correlation_id, const char* detail) {
    JobOutcome out;
    out.correlation_id = correlation_id;
    out.error = ProxyError::kAdmissionRejected;
    out.last_cause = ProxyError::kAdmissionRejected;
    out.detail = detail;
    return EncodeOutcome(out);
  }

  Dispatcher& dispatcher_;
  ProxyServerConfig cfg_;
  RateLimiter limiter_;

  TcpListener listener_;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;

  std::mutex mutex_;
  std::vector<Entry> entries_;

  std::atomic<uint32_t> active_{0U};
  std::atomic<uint64_t> accepted_{0U};
  std::atomic<uint64_t> refused_{0U};
  std::atomic<uint64_t> rate_limited_{0U};
  std::atomic<uint64_t> admission_rejected_{0U};
  std::atomic<uint64_t> worker_updates_{0U};
};

}  // namespace ppx

#endif  // PPX_HAS_NETWORK

#endif  // PPX_PROXY_SERVER_HPP_
