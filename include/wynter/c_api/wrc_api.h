#pragma once

#include "wrc_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define WRC_API_VERSION_MAJOR 1
#define WRC_API_VERSION_MINOR 0
#define WRC_API_VERSION_PATCH 0

typedef enum {
    WRC_SUCCESS = 0,
    WRC_ERROR_ENTROPY_UNAVAILABLE = 1,
    WRC_ERROR_INVALID_KEY_FORMAT = 2,
    WRC_ERROR_AUTHENTICATION_FAILED = 3,
    WRC_ERROR_MALFORMED_MESSAGE = 4,
    WRC_ERROR_STALE_ENVELOPE = 5,
    WRC_ERROR_MISROUTED_ENVELOPE = 6,
    WRC_ERROR_REPLAY_DETECTED = 7,
    WRC_ERROR_INVALID_STATE = 8,
    WRC_ERROR_INVALID_INPUT = 9,
    WRC_ERROR_DERIVE_KEY = 10,
    WRC_ERROR_ENCODE = 11,
    WRC_ERROR_TRANSPORT = 12,
    WRC_ERROR_NULL_POINTER = 13,
    WRC_ERROR_OUT_OF_MEMORY = 14,
    WRC_ERROR_SODIUM_FAILURE = 15
} WrcErrorCode;

typedef enum {
    WRC_CHANNEL_UNPAIRED = 0,
    WRC_CHANNEL_ACTIVE = 1
} WrcChannelState;

typedef struct WrcKeyPairHandle WrcKeyPairHandle;
typedef struct WrcChannelHandle WrcChannelHandle;

typedef struct WrcBuffer {
    uint8_t* data;
    size_t length;
} WrcBuffer;

typedef struct WrcError {
    WrcErrorCode code;
    char* message;
} WrcError;

WRC_API const char* wrc_version(void);

WRC_API WrcErrorCode wrc_init(void);

/* Device key pairs */

WRC_API WrcErrorCode wrc_keypair_create(
    WrcKeyPairHandle** out_handle,
    WrcError* out_error);

WRC_API WrcErrorCode wrc_keypair_restore(
    const uint8_t* private_key,
    size_t private_key_length,
    WrcKeyPairHandle** out_handle,
    WrcError* out_error);

/* Writes the 44-character base64 public key, not NUL-terminated. */
WRC_API WrcErrorCode wrc_keypair_export_public(
    const WrcKeyPairHandle* handle,
    WrcBuffer* out_public_key,
    WrcError* out_error);

WRC_API WrcErrorCode wrc_keypair_export_private(
    const WrcKeyPairHandle* handle,
    WrcBuffer* out_private_key,
    WrcError* out_error);

WRC_API void wrc_keypair_destroy(WrcKeyPairHandle* handle);

/* Channels */

/* The channel keeps its own copy of the key pair; the handle stays owned by
 * the caller. max_clock_skew_seconds of 0 selects the default window. */
WRC_API WrcErrorCode wrc_channel_create(
    const char* local_device_id,
    const WrcKeyPairHandle* key_pair,
    uint32_t max_clock_skew_seconds,
    WrcChannelHandle** out_handle,
    WrcError* out_error);

WRC_API WrcErrorCode wrc_channel_pair(
    WrcChannelHandle* handle,
    const char* peer_device_id,
    const char* peer_public_key_base64,
    WrcError* out_error);

WRC_API WrcErrorCode wrc_channel_unpair(
    WrcChannelHandle* handle,
    WrcError* out_error);

WRC_API WrcErrorCode wrc_channel_state(
    const WrcChannelHandle* handle,
    WrcChannelState* out_state,
    WrcError* out_error);

/* Encrypts a JSON payload and writes the envelope as JSON. */
WRC_API WrcErrorCode wrc_channel_encrypt_json(
    const WrcChannelHandle* handle,
    const uint8_t* message_json,
    size_t message_json_length,
    WrcBuffer* out_envelope_json,
    WrcError* out_error);

/* Validates and decrypts an envelope JSON, writes the payload as JSON. */
WRC_API WrcErrorCode wrc_channel_decrypt_json(
    WrcChannelHandle* handle,
    const uint8_t* envelope_json,
    size_t envelope_json_length,
    WrcBuffer* out_message_json,
    WrcError* out_error);

WRC_API void wrc_channel_destroy(WrcChannelHandle* handle);

/* Memory */

/* Wipes and releases the data of a buffer filled by this library. The
 * WrcBuffer struct itself belongs to the caller. */
WRC_API void wrc_buffer_release(WrcBuffer* buffer);

WRC_API void wrc_error_free(WrcError* error);

WRC_API const char* wrc_error_string(WrcErrorCode code);

WRC_API WrcErrorCode wrc_secure_wipe(uint8_t* data, size_t length);

#ifdef __cplusplus
}
#endif
