#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace wynter::relay {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;

inline constexpr size_t kSessionKeyBytes = 32;
inline constexpr size_t kXChaChaKeyBytes = 32;
inline constexpr size_t kXChaChaNonceBytes = 24;
inline constexpr size_t kPoly1305TagBytes = 16;

inline constexpr size_t kHkdfHashBytes = 32;
inline constexpr size_t kHkdfMaxOutputBytes = 255 * kHkdfHashBytes;

// HKDF info label; both endpoints must agree on it byte for byte.
inline constexpr std::string_view kRelayKeyInfo = "wynter-relay-v1";

// Encoded length of a 32-byte key in padded standard base64.
inline constexpr size_t kPublicKeyBase64Chars = 44;

inline constexpr size_t kSmallBufferThreshold = 1024;
inline constexpr size_t kMaxSecureBufferBytes = 1'000'000'000;

inline constexpr std::chrono::seconds kDefaultMaxClockSkew{300};
inline constexpr std::chrono::seconds kStrictMaxClockSkew{60};
inline constexpr std::chrono::seconds kLenientMaxClockSkew{900};
inline constexpr std::chrono::seconds kMaxConfigurableClockSkew{24 * 60 * 60};
inline constexpr size_t kDefaultReplayCacheCapacity = 4096;

// Relay frame type tags (JSON "type" field).
inline constexpr std::string_view kFrameHandshake = "handshake";
inline constexpr std::string_view kFrameHandshakeAck = "handshake_ack";
inline constexpr std::string_view kFrameMessage = "message";
inline constexpr std::string_view kFramePing = "ping";
inline constexpr std::string_view kFramePong = "pong";
inline constexpr std::string_view kFramePeerStatus = "peer_status";

}  // namespace wynter::relay
