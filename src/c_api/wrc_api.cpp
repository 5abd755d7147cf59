/**
 * @file wrc_api.cpp
 * @brief C bindings over device key pairs and relay channels
 */

#include "wynter/c_api/wrc_api.h"
#include "wrc_internal.hpp"
#include "wynter/configuration/channel_config.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include "wynter/protocol/envelope_wire.hpp"
#include "wynter/protocol/payload_codec.hpp"
#include <google/protobuf/struct.pb.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace wynter::relay;
using namespace wynter::relay::crypto;
using namespace wynter::relay::identity;
using namespace wynter::relay::protocol;
using wynter::relay::configuration::ChannelConfig;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace wrc::internal {

WrcErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? WRC_SUCCESS
               : WRC_ERROR_SODIUM_FAILURE;
}

void fill_error(WrcError* out_error, const WrcErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

WrcErrorCode fill_error_from_failure(WrcError* out_error, const RelayFailure& failure) {
    WrcErrorCode code = WRC_ERROR_INVALID_STATE;

    switch (failure.type) {
        case RelayFailureType::EntropyUnavailable:
            code = WRC_ERROR_ENTROPY_UNAVAILABLE;
            break;
        case RelayFailureType::InvalidKeyFormat:
            code = WRC_ERROR_INVALID_KEY_FORMAT;
            break;
        case RelayFailureType::AuthenticationFailed:
            code = WRC_ERROR_AUTHENTICATION_FAILED;
            break;
        case RelayFailureType::MalformedMessage:
            code = WRC_ERROR_MALFORMED_MESSAGE;
            break;
        case RelayFailureType::StaleEnvelope:
            code = WRC_ERROR_STALE_ENVELOPE;
            break;
        case RelayFailureType::MisroutedEnvelope:
            code = WRC_ERROR_MISROUTED_ENVELOPE;
            break;
        case RelayFailureType::ReplayDetected:
            code = WRC_ERROR_REPLAY_DETECTED;
            break;
        case RelayFailureType::InvalidState:
            code = WRC_ERROR_INVALID_STATE;
            break;
        case RelayFailureType::InvalidInput:
            code = WRC_ERROR_INVALID_INPUT;
            break;
        case RelayFailureType::DeriveKey:
            code = WRC_ERROR_DERIVE_KEY;
            break;
        case RelayFailureType::Encode:
            code = WRC_ERROR_ENCODE;
            break;
        case RelayFailureType::Transport:
            code = WRC_ERROR_TRANSPORT;
            break;
    }

    if (out_error) {
        fill_error(out_error, code, failure.message);
    }
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, WrcError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, WrcError* out_error) {
    if (!handle) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Output handle pointer is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, WrcBuffer* out_buffer, WrcError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }
    out_buffer->data = nullptr;
    out_buffer->length = 0;
    if (input.empty()) {
        return true;
    }

    auto* data = new(std::nothrow) uint8_t[input.size()];
    if (!data) {
        fill_error(out_error, WRC_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, input.data(), input.size());
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

}  // namespace wrc::internal

using namespace wrc::internal;

namespace {

std::span<const uint8_t> as_bytes(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

WrcErrorCode wrap_key_pair(
    Result<DeviceKeyPair, RelayFailure> result,
    WrcKeyPairHandle** out_handle,
    WrcError* out_error) {
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }

    auto* handle = new(std::nothrow) WrcKeyPairHandle{
        std::make_unique<DeviceKeyPair>(std::move(result).Unwrap())
    };

    if (!handle) {
        fill_error(out_error, WRC_ERROR_OUT_OF_MEMORY, "Failed to allocate key pair handle");
        return WRC_ERROR_OUT_OF_MEMORY;
    }

    *out_handle = handle;
    return WRC_SUCCESS;
}

}  // namespace

// ============================================================================
// C API Implementations
// ============================================================================

extern "C" {

const char* wrc_version(void) {
    return "1.0.0";
}

WrcErrorCode wrc_init(void) {
    return EnsureInitialized();
}

WrcErrorCode wrc_keypair_create(
    WrcKeyPairHandle** out_handle,
    WrcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WRC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }
    return wrap_key_pair(DeviceKeyPair::Generate(), out_handle, out_error);
}

WrcErrorCode wrc_keypair_restore(
    const uint8_t* private_key,
    const size_t private_key_length,
    WrcKeyPairHandle** out_handle,
    WrcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WRC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!private_key) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Private key is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }
    return wrap_key_pair(
        DeviceKeyPair::FromPrivateKey(std::span(private_key, private_key_length)),
        out_handle,
        out_error);
}

WrcErrorCode wrc_keypair_export_public(
    const WrcKeyPairHandle* handle,
    WrcBuffer* out_public_key,
    WrcError* out_error) {
    if (!handle || !handle->key_pair) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Key pair handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    const std::string encoded = handle->key_pair->ExportPublicKey();
    if (!copy_to_buffer(as_bytes(encoded), out_public_key, out_error)) {
        return out_public_key ? WRC_ERROR_OUT_OF_MEMORY : WRC_ERROR_NULL_POINTER;
    }
    return WRC_SUCCESS;
}

WrcErrorCode wrc_keypair_export_private(
    const WrcKeyPairHandle* handle,
    WrcBuffer* out_private_key,
    WrcError* out_error) {
    if (!handle || !handle->key_pair) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Key pair handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    auto result = handle->key_pair->ExportPrivateKey();
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }
    std::vector<uint8_t> private_key = std::move(result).Unwrap();
    const bool copied = copy_to_buffer(private_key, out_private_key, out_error);
    (void)SodiumInterop::SecureWipe(private_key);
    if (!copied) {
        return out_private_key ? WRC_ERROR_OUT_OF_MEMORY : WRC_ERROR_NULL_POINTER;
    }
    return WRC_SUCCESS;
}

void wrc_keypair_destroy(WrcKeyPairHandle* handle) {
    delete handle;
}

WrcErrorCode wrc_channel_create(
    const char* local_device_id,
    const WrcKeyPairHandle* key_pair,
    const uint32_t max_clock_skew_seconds,
    WrcChannelHandle** out_handle,
    WrcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WRC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!local_device_id) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Local device id is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!key_pair || !key_pair->key_pair) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Key pair handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }

    auto exported = key_pair->key_pair->ExportPrivateKey();
    if (exported.IsErr()) {
        return fill_error_from_failure(out_error, std::move(exported).UnwrapErr());
    }
    std::vector<uint8_t> private_key = std::move(exported).Unwrap();
    auto copy = DeviceKeyPair::FromPrivateKey(private_key);
    (void)SodiumInterop::SecureWipe(private_key);
    if (copy.IsErr()) {
        return fill_error_from_failure(out_error, std::move(copy).UnwrapErr());
    }

    ChannelOptions options;
    if (max_clock_skew_seconds > 0) {
        options.config = ChannelConfig::Default().WithMaxClockSkew(
            std::chrono::seconds(max_clock_skew_seconds));
    }

    auto result = RelayChannel::Create(local_device_id, std::move(copy).Unwrap(), std::move(options));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }

    auto* handle = new(std::nothrow) WrcChannelHandle{std::move(result).Unwrap()};
    if (!handle) {
        fill_error(out_error, WRC_ERROR_OUT_OF_MEMORY, "Failed to allocate channel handle");
        return WRC_ERROR_OUT_OF_MEMORY;
    }

    *out_handle = handle;
    return WRC_SUCCESS;
}

WrcErrorCode wrc_channel_pair(
    WrcChannelHandle* handle,
    const char* peer_device_id,
    const char* peer_public_key_base64,
    WrcError* out_error) {
    if (!handle || !handle->channel) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Channel handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!peer_device_id || !peer_public_key_base64) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Peer id or public key is null");
        return WRC_ERROR_NULL_POINTER;
    }
    auto result = handle->channel->PairWithEncodedKey(peer_device_id, peer_public_key_base64);
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }
    return WRC_SUCCESS;
}

WrcErrorCode wrc_channel_unpair(
    WrcChannelHandle* handle,
    WrcError* out_error) {
    if (!handle || !handle->channel) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Channel handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    handle->channel->Unpair();
    return WRC_SUCCESS;
}

WrcErrorCode wrc_channel_state(
    const WrcChannelHandle* handle,
    WrcChannelState* out_state,
    WrcError* out_error) {
    if (!handle || !handle->channel) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Channel handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_state, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }
    *out_state = handle->channel->State() == ChannelState::Active
                     ? WRC_CHANNEL_ACTIVE
                     : WRC_CHANNEL_UNPAIRED;
    return WRC_SUCCESS;
}

WrcErrorCode wrc_channel_encrypt_json(
    const WrcChannelHandle* handle,
    const uint8_t* message_json,
    const size_t message_json_length,
    WrcBuffer* out_envelope_json,
    WrcError* out_error) {
    if (!handle || !handle->channel) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Channel handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(message_json, message_json_length, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_envelope_json, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }

    auto message = PayloadCodec<google::protobuf::Value>::Decode(
        std::span(message_json, message_json_length));
    if (message.IsErr()) {
        return fill_error_from_failure(out_error, std::move(message).UnwrapErr());
    }
    auto sealed = handle->channel->Seal(message.Unwrap());
    if (sealed.IsErr()) {
        return fill_error_from_failure(out_error, std::move(sealed).UnwrapErr());
    }
    auto json = EnvelopeWire::ToJson(sealed.Unwrap());
    if (json.IsErr()) {
        return fill_error_from_failure(out_error, std::move(json).UnwrapErr());
    }
    if (!copy_to_buffer(as_bytes(json.Unwrap()), out_envelope_json, out_error)) {
        return WRC_ERROR_OUT_OF_MEMORY;
    }
    return WRC_SUCCESS;
}

WrcErrorCode wrc_channel_decrypt_json(
    WrcChannelHandle* handle,
    const uint8_t* envelope_json,
    const size_t envelope_json_length,
    WrcBuffer* out_message_json,
    WrcError* out_error) {
    if (!handle || !handle->channel) {
        fill_error(out_error, WRC_ERROR_NULL_POINTER, "Channel handle is null");
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(envelope_json, envelope_json_length, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_message_json, out_error)) {
        return WRC_ERROR_NULL_POINTER;
    }

    const std::string_view text(
        reinterpret_cast<const char*>(envelope_json), envelope_json_length);
    auto envelope = EnvelopeWire::FromJson(text);
    if (envelope.IsErr()) {
        return fill_error_from_failure(out_error, std::move(envelope).UnwrapErr());
    }
    auto message = handle->channel->OnEnvelope<google::protobuf::Value>(envelope.Unwrap());
    if (message.IsErr()) {
        return fill_error_from_failure(out_error, std::move(message).UnwrapErr());
    }
    auto encoded = PayloadCodec<google::protobuf::Value>::Encode(message.Unwrap());
    if (encoded.IsErr()) {
        return fill_error_from_failure(out_error, std::move(encoded).UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(encoded).Unwrap();
    const bool copied = copy_to_buffer(plaintext, out_message_json, out_error);
    (void)SodiumInterop::SecureWipe(plaintext);
    if (!copied) {
        return WRC_ERROR_OUT_OF_MEMORY;
    }
    return WRC_SUCCESS;
}

void wrc_channel_destroy(WrcChannelHandle* handle) {
    delete handle;
}

void wrc_buffer_release(WrcBuffer* buffer) {
    if (buffer && buffer->data) {
        (void)SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void wrc_error_free(WrcError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* wrc_error_string(const WrcErrorCode code) {
    switch (code) {
        case WRC_SUCCESS: return "Success";
        case WRC_ERROR_ENTROPY_UNAVAILABLE: return "Entropy unavailable";
        case WRC_ERROR_INVALID_KEY_FORMAT: return "Invalid key format";
        case WRC_ERROR_AUTHENTICATION_FAILED: return "Authentication failed";
        case WRC_ERROR_MALFORMED_MESSAGE: return "Malformed message";
        case WRC_ERROR_STALE_ENVELOPE: return "Stale envelope";
        case WRC_ERROR_MISROUTED_ENVELOPE: return "Misrouted envelope";
        case WRC_ERROR_REPLAY_DETECTED: return "Replay detected";
        case WRC_ERROR_INVALID_STATE: return "Invalid state";
        case WRC_ERROR_INVALID_INPUT: return "Invalid input";
        case WRC_ERROR_DERIVE_KEY: return "Key derivation failed";
        case WRC_ERROR_ENCODE: return "Encoding failed";
        case WRC_ERROR_TRANSPORT: return "Transport failure";
        case WRC_ERROR_NULL_POINTER: return "Null pointer";
        case WRC_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case WRC_ERROR_SODIUM_FAILURE: return "Sodium library failure";
        default: return "Unknown error";
    }
}

WrcErrorCode wrc_secure_wipe(uint8_t* data, const size_t length) {
    if (!data && length > 0) {
        return WRC_ERROR_NULL_POINTER;
    }

    if (length > 0) {
        if (SodiumInterop::SecureWipe(std::span(data, length)).IsErr()) {
            return WRC_ERROR_SODIUM_FAILURE;
        }
    }

    return WRC_SUCCESS;
}

}  // extern "C"
