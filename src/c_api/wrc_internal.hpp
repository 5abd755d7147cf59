/**
 * @file wrc_internal.hpp
 * @brief Handle definitions and helpers shared by the C API implementation
 *
 * Not part of the public API.
 */

#ifndef WRC_INTERNAL_HPP
#define WRC_INTERNAL_HPP

#include "wynter/c_api/wrc_api.h"
#include "wynter/core/failures.hpp"
#include "wynter/identity/device_key_pair.hpp"
#include "wynter/protocol/relay_channel.hpp"
#include <memory>
#include <span>
#include <string>

/**
 * @brief Opaque handle wrapping a device key pair
 */
struct WrcKeyPairHandle {
    std::unique_ptr<wynter::relay::identity::DeviceKeyPair> key_pair;
};

/**
 * @brief Opaque handle wrapping a relay channel
 */
struct WrcChannelHandle {
    std::unique_ptr<wynter::relay::protocol::RelayChannel> channel;
};

namespace wrc::internal {

using namespace wynter::relay;

/**
 * @brief Ensure libsodium is initialized
 * @return WRC_SUCCESS if initialized, WRC_ERROR_SODIUM_FAILURE otherwise
 */
WrcErrorCode EnsureInitialized();

void fill_error(WrcError* out_error, WrcErrorCode code, const std::string& message);

/**
 * @brief Map a RelayFailure to its error code and fill out_error
 * @return The mapped error code
 */
WrcErrorCode fill_error_from_failure(WrcError* out_error, const RelayFailure& failure);

bool validate_buffer_param(const uint8_t* data, size_t length, WrcError* out_error);

bool validate_output_handle(const void* handle, WrcError* out_error);

/// Copy input into a freshly allocated buffer owned by the caller.
bool copy_to_buffer(std::span<const uint8_t> input, WrcBuffer* out_buffer, WrcError* out_error);

}  // namespace wrc::internal

#endif  // WRC_INTERNAL_HPP
