#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/constants.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace wynter::relay::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Extract and Expand run as one derive call. An empty salt means the
 * RFC default of HashLen zero bytes.
 */
class Hkdf {
public:
    /**
     * @brief Fill output with derived key material
     *
     * @param ikm Input key material, must not be empty
     * @param output Destination, at most kHkdfMaxOutputBytes
     * @param salt Optional salt
     * @param info Optional context label
     */
    static Result<Unit, RelayFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, RelayFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = kHkdfHashBytes;
    static constexpr size_t MAX_OUTPUT_LEN = kHkdfMaxOutputBytes;

private:
    Hkdf() = delete;
};

}  // namespace wynter::relay::crypto
