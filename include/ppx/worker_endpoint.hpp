/**
 * @file worker_endpoint.hpp
 * @brief Worker side of the proxy protocol: answers probes and runs proving
 *        requests through a user handler.
 *
 * One accept thread, one thread per connection. A connection may carry any
 * number of request frames. Finished connection threads are reaped by the
 * accept loop.
 */

#ifndef PPX_WORKER_ENDPOINT_HPP_
#define PPX_WORKER_ENDPOINT_HPP_

#include "ppx/job.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/protocol.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"

#if PPX_HAS_NETWORK

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ppx {

/**
 * @brief Proving handler.
 * @param[out] proof Output on success.
 * @param[out] error Message on failure.
 * @return true if a proof was produced.
 */
using ProveFn = bool (*)(JobId job, const Payload& input, Payload& proof,
                         std::string& error, void* ctx);

enum class EndpointError : uint8_t { kAlreadyRunning = 0, kBindFailed };

struct WorkerEndpointConfig {
  uint32_t max_connections = 32;
};

class WorkerEndpoint final {
 public:
  WorkerEndpoint(ProveFn fn, void* ctx,
                 const WorkerEndpointConfig& cfg = WorkerEndpointConfig())
      : fn_(fn), ctx_(ctx), cfg_(cfg) {}

  ~WorkerEndpoint() { Stop(); }

  WorkerEndpoint(const WorkerEndpoint&) = delete;
  WorkerEndpoint& operator=(const WorkerEndpoint&) = delete;

  expected<void, EndpointError> Start(const SocketAddress& addr) {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, EndpointError>::error(EndpointError::kAlreadyRunning);
    }
    auto l = TcpListener::Bind(addr);
    if (!l.has_value()) {
      PPX_LOG_ERROR("WORKER", "bind failed: %s",
                    SocketErrorToString(l.get_error()));
      return expected<void, EndpointError>::error(EndpointError::kBindFailed);
    }
    listener_ = std::move(l.value());
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    PPX_LOG_INFO("WORKER", "worker endpoint listening on port %u",
                 static_cast<unsigned>(listener_.LocalPort()));
    return expected<void, EndpointError>::success();
  }

  void Stop() {
    if (!running_.exchange(false)) return;
    listener_.Shutdown();
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.Close();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (int32_t fd : conn_fds_) (void)::shutdown(fd, SHUT_RDWR);
    }
    std::vector<Entry> entries;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      entries.swap(entries_);
    }
    for (Entry& e : entries) {
      if (e.thread.joinable()) e.thread.join();
    }
  }

  uint16_t Port() const noexcept { return listener_.LocalPort(); }

  /// @brief When false, probe connections are dropped unanswered.
  void SetProbeResponsive(bool responsive) noexcept {
    probe_responsive_.store(responsive, std::memory_order_release);
  }

  uint64_t JobsServed() const noexcept {
    return jobs_served_.load(std::memory_order_relaxed);
  }
  uint64_t ProbesAnswered() const noexcept {
    return probes_answered_.load(std::memory_order_relaxed);
  }

 private:
  struct Entry {
    std::thread thread;
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
      std::lock_guard<std::mutex> lock(mutex_);
      if (entries_.size() >= cfg_.max_connections) {
        continue;  // conn closes on scope exit
      }
      auto sock = std::make_shared<TcpSocket>(std::move(conn.value()));
      conn_fds_.push_back(sock->Fd());
      auto finished = std::make_shared<std::atomic<bool>>(false);
      entries_.push_back(Entry{std::thread([this, sock, finished]() {
                                 HandleConnection(*sock);
                                 Forget(sock->Fd());
                                 sock->Close();
                                 finished->store(true, std::memory_order_release);
                               }),
                               finished});
    }
  }

  void Forget(int32_t fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(conn_fds_.begin(), conn_fds_.end(), fd);
    if (it != conn_fds_.end()) conn_fds_.erase(it);
  }

  void HandleConnection(TcpSocket& sock) {
    while (running_.load(std::memory_order_acquire)) {
      auto req = ReadFrame(sock);
      if (!req.has_value()) return;
      Frame& f = req.value();

      if (f.header.type == FrameType::kProbe) {
        if (!probe_responsive_.load(std::memory_order_acquire)) return;
        if (!WriteFrame(sock, MakeFrame(FrameType::kProbeAck, f.header.id))
                 .has_value()) {
          return;
        }
        probes_answered_.fetch_add(1U, std::memory_order_relaxed);
        continue;
      }
      if (f.header.type != FrameType::kProveRequest) {
        PPX_LOG_WARN("WORKER", "unexpected frame type %u",
                     static_cast<unsigned>(f.header.type));
        return;
      }

      const JobId job(f.header.id);
      Payload proof;
      std::string error;
      const bool ok = (fn_ != nullptr) && fn_(job, f.payload, proof, error, ctx_);
      Frame resp = MakeFrame(FrameType::kProveResponse, f.header.id);
      if (ok) {
        resp.payload = std::move(proof);
      } else {
        resp.header.error = ProxyError::kWorkerError;
        resp.payload = TextPayload(error.empty() ? "proving failed" : error);
      }
      if (!WriteFrame(sock, resp).has_value()) return;
      jobs_served_.fetch_add(1U, std::memory_order_relaxed);
    }
  }

  ProveFn fn_;
  void* ctx_;
  WorkerEndpointConfig cfg_;

  TcpListener listener_;
  std::atomic<bool> running_{false};
  std::atomic<bool> probe_responsive_{true};
  std::thread accept_thread_;

  std::mutex mutex_;
  std::vector<Entry> entries_;
  std::vector<int32_t> conn_fds_;

  std::atomic<uint64_t> jobs_served_{0U};
  std::atomic<uint64_t> probes_answered_{0U};
};

}  // namespace ppx

#endif  // PPX_HAS_NETWORK

#endif  // PPX_WORKER_ENDPOINT_HPP_
