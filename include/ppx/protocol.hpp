/**
 * @file protocol.hpp
 * @brief Length-prefixed binary frames spoken between clients, the proxy
 *        and workers.
 *
 * Frame layout (24-byte header, little-endian integers):
 *
 *   offset  size  field
 *   0       4     magic "PPXF"
 *   4       1     type        (FrameType)
 *   5       1     error       (ProxyError, kNone on success)
 *   6       1     cause       (ProxyError, last failure cause)
 *   7       1     reserved
 *   8       8     id          (client correlation id or JobId)
 *   16      4     retry_count
 *   20      4     payload_len
 *   24      N     payload
 */

#ifndef PPX_PROTOCOL_HPP_
#define PPX_PROTOCOL_HPP_

#include "ppx/job.hpp"
#include "ppx/platform.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#ifndef PPX_MAX_FRAME_PAYLOAD
#define PPX_MAX_FRAME_PAYLOAD (16U * 1024U * 1024U)
#endif

namespace ppx {

constexpr uint32_t kFrameMagic = 0x46585050U;  // "PPXF"
constexpr uint32_t kFrameHeaderSize = 24U;

enum class FrameType : uint8_t {
  kSubmit = 1,        ///< client -> proxy
  kResult,            ///< proxy -> client
  kProveRequest,      ///< proxy -> worker
  kProveResponse,     ///< worker -> proxy
  kProbe,             ///< proxy -> worker
  kProbeAck,          ///< worker -> proxy
  kWorkerUpdate,      ///< operator -> proxy
  kWorkerUpdateAck    ///< proxy -> operator
};

enum class FrameError : uint8_t {
  kIo = 0,
  kTimeout,
  kPeerClosed,
  kBadMagic,
  kBadType,
  kPayloadTooLarge
};

inline const char* FrameErrorToString(FrameError e) noexcept {
  switch (e) {
    case FrameError::kIo:
      return "i/o error";
    case FrameError::kTimeout:
      return "timeout";
    case FrameError::kPeerClosed:
      return "peer closed";
    case FrameError::kBadMagic:
      return "bad magic";
    case FrameError::kBadType:
      return "bad frame type";
    case FrameError::kPayloadTooLarge:
      return "payload too large";
  }
  return "unknown";
}

struct FrameHeader {
  FrameType type = FrameType::kSubmit;
  ProxyError error = ProxyError::kNone;
  ProxyError cause = ProxyError::kNone;
  uint64_t id = 0;
  uint32_t retry_count = 0;
  uint32_t payload_len = 0;
};

struct Frame {
  FrameHeader header;
  Payload payload;
};

// ============================================================================
// Header codec
// ============================================================================

namespace detail {

inline void PutLe32(uint8_t* p, uint32_t v) noexcept {
  for (uint32_t i = 0; i < 4U; ++i) p[i] = static_cast<uint8_t>(v >> (8U * i));
}

inline void PutLe64(uint8_t* p, uint64_t v) noexcept {
  for (uint32_t i = 0; i < 8U; ++i) p[i] = static_cast<uint8_t>(v >> (8U * i));
}

inline uint32_t GetLe32(const uint8_t* p) noexcept {
  uint32_t v = 0;
  for (uint32_t i = 0; i < 4U; ++i) v |= static_cast<uint32_t>(p[i]) << (8U * i);
  return v;
}

inline uint64_t GetLe64(const uint8_t* p) noexcept {
  uint64_t v = 0;
  for (uint32_t i = 0; i < 8U; ++i) v |= static_cast<uint64_t>(p[i]) << (8U * i);
  return v;
}

}  // namespace detail

inline void EncodeHeader(const FrameHeader& h, uint8_t* out) noexcept {
  detail::PutLe32(out, kFrameMagic);
  out[4] = static_cast<uint8_t>(h.type);
  out[5] = static_cast<uint8_t>(h.error);
  out[6] = static_cast<uint8_t>(h.cause);
  out[7] = 0U;
  detail::PutLe64(out + 8, h.id);
  detail::PutLe32(out + 16, h.retry_count);
  detail::PutLe32(out + 20, h.payload_len);
}

inline expected<FrameHeader, FrameError> DecodeHeader(const uint8_t* in) noexcept {
  if (detail::GetLe32(in) != kFrameMagic) {
    return expected<FrameHeader, FrameError>::error(FrameError::kBadMagic);
  }
  const uint8_t type = in[4];
  if (type < static_cast<uint8_t>(FrameType::kSubmit) ||
      type > static_cast<uint8_t>(FrameType::kWorkerUpdateAck)) {
    return expected<FrameHeader, FrameError>::error(FrameError::kBadType);
  }
  FrameHeader h;
  h.type = static_cast<FrameType>(type);
  h.error = static_cast<ProxyError>(in[5]);
  h.cause = static_cast<ProxyError>(in[6]);
  h.id = detail::GetLe64(in + 8);
  h.retry_count = detail::GetLe32(in + 16);
  h.payload_len = detail::GetLe32(in + 20);
  if (h.payload_len > PPX_MAX_FRAME_PAYLOAD) {
    return expected<FrameHeader, FrameError>::error(FrameError::kPayloadTooLarge);
  }
  return expected<FrameHeader, FrameError>::success(h);
}

inline Frame MakeFrame(FrameType type, uint64_t id, Payload payload = Payload()) {
  Frame f;
  f.header.type = type;
  f.header.id = id;
  f.payload = std::move(payload);
  return f;
}

inline Payload TextPayload(const std::string& text) {
  return Payload(text.begin(), text.end());
}

inline std::string PayloadText(const Payload& payload) {
  return std::string(payload.begin(), payload.end());
}

// ============================================================================
// Socket I/O
// ============================================================================

#if PPX_HAS_NETWORK

namespace detail {

inline FrameError FromSocketError(SocketError e) noexcept {
  switch (e) {
    case SocketError::kTimeout:
      return FrameError::kTimeout;
    case SocketError::kPeerClosed:
      return FrameError::kPeerClosed;
    default:
      return FrameError::kIo;
  }
}

}  // namespace detail

/// Header and payload go out in one send when the payload is small.
inline expected<void, FrameError> WriteFrame(TcpSocket& sock, const Frame& f) {
  FrameHeader h = f.header;
  h.payload_len = static_cast<uint32_t>(f.payload.size());
  std::vector<uint8_t> buf(kFrameHeaderSize + f.payload.size());
  EncodeHeader(h, buf.data());
  if (!f.payload.empty()) {
    std::memcpy(buf.data() + kFrameHeaderSize, f.payload.data(),
                f.payload.size());
  }
  auto r = sock.SendAll(buf.data(), buf.size());
  if (!r.has_value()) {
    return expected<void, FrameError>::error(
        detail::FromSocketError(r.get_error()));
  }
  return expected<void, FrameError>::success();
}

inline expected<Frame, FrameError> ReadFrame(TcpSocket& sock) {
  uint8_t raw[kFrameHeaderSize];
  auto r = sock.RecvAll(raw, sizeof(raw));
  if (!r.has_value()) {
    return expected<Frame, FrameError>::error(
        detail::FromSocketError(r.get_error()));
  }
  auto h = DecodeHeader(raw);
  if (!h.has_value()) {
    return expected<Frame, FrameError>::error(h.get_error());
  }
  Frame f;
  f.header = h.value();
  f.payload.resize(f.header.payload_len);
  if (f.header.payload_len > 0U) {
    auto p = sock.RecvAll(f.payload.data(), f.payload.size());
    if (!p.has_value()) {
      return expected<Frame, FrameError>::error(
          detail::FromSocketError(p.get_error()));
    }
  }
  return expected<Frame, FrameError>::success(std::move(f));
}

#endif  // PPX_HAS_NETWORK

// ============================================================================
// Message helpers
// ============================================================================

/// kResult frame for a terminal job outcome.
inline Frame EncodeOutcome(const JobOutcome& out) {
  Frame f = MakeFrame(FrameType::kResult, out.correlation_id);
  f.header.error = out.error;
  f.header.cause = out.last_cause;
  f.header.retry_count = out.retry_count;
  if (out.ok()) {
    f.payload = out.proof;
  } else {
    std::string text = ProxyErrorToString(out.error);
    if (!out.detail.empty()) {
      text += ": ";
      text += out.detail;
    }
    f.payload = TextPayload(text);
  }
  return f;
}

/// Client-side view of a kResult frame.
struct ResultMessage {
  uint64_t correlation_id = 0;
  ProxyError error = ProxyError::kNone;
  ProxyError last_cause = ProxyError::kNone;
  uint32_t retry_count = 0;
  Payload proof;        ///< Set on success.
  std::string message;  ///< Set on failure.

  bool ok() const noexcept { return error == ProxyError::kNone; }
};

inline ResultMessage DecodeResult(const Frame& f) {
  ResultMessage m;
  m.correlation_id = f.header.id;
  m.error = f.header.error;
  m.last_cause = f.header.cause;
  m.retry_count = f.header.retry_count;
  if (m.ok()) {
    m.proof = f.payload;
  } else {
    m.message = PayloadText(f.payload);
  }
  return m;
}

enum class WorkerUpdateAction : uint8_t { kAdd = 0, kRemove };

struct WorkerUpdate {
  WorkerUpdateAction action = WorkerUpdateAction::kAdd;
  std::vector<std::string> addresses;
};

/// Payload text: "add|remove addr [addr...]".
inline Payload EncodeWorkerUpdate(const WorkerUpdate& u) {
  std::string text = (u.action == WorkerUpdateAction::kAdd) ? "add" : "remove";
  for (const std::string& a : u.addresses) {
    text.push_back(' ');
    text += a;
  }
  return TextPayload(text);
}

inline optional<WorkerUpdate> ParseWorkerUpdate(const Payload& payload) {
  std::vector<std::string> words;
  std::string cur;
  for (uint8_t c : payload) {
    if (c == ' ' || c == '\t' || c == '\n' || c == ',') {
      if (!cur.empty()) words.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(static_cast<char>(c));
    }
  }
  if (!cur.empty()) words.push_back(cur);
  if (words.size() < 2U) return optional<WorkerUpdate>();

  WorkerUpdate u;
  if (words[0] == "add") {
    u.action = WorkerUpdateAction::kAdd;
  } else if (words[0] == "remove") {
    u.action = WorkerUpdateAction::kRemove;
  } else {
    return optional<WorkerUpdate>();
  }
  u.addresses.assign(words.begin() + 1, words.end());
  return optional<WorkerUpdate>(std::move(u));
}

}  // namespace ppx

#endif  // PPX_PROTOCOL_HPP_
