#pragma once

/**
 * @file identity.hpp
 * @brief Identifier utilities for stillhere
 *
 * UUID generation and validation for devices, and a stable identifier for
 * the local process recorded on the devices it fires.
 */

#include <string>

namespace stillhere {
namespace identity {

/**
 * @brief Generate a random RFC 4122 version 4 UUID
 *
 * Uses OpenSSL's CSPRNG. Lower-case canonical 8-4-4-4-12 form.
 *
 * @return UUID string, or empty string if the random generator failed
 */
[[nodiscard]] std::string generate_uuid();

/**
 * @brief Check whether a string is a canonical UUID (8-4-4-4-12 hex digits)
 *
 * Upper- and lower-case hex digits are accepted; braces and URN prefixes are not.
 */
[[nodiscard]] bool is_uuid(const std::string& value);

/**
 * @brief Derive an identifier for this consumer process
 *
 * SHA-256 over the machine id (when available), the hostname and the process
 * id, truncated to 32 hex characters. Stable for the lifetime of the process.
 *
 * @return 32 hex characters, or "unknown-consumer" if hashing failed
 */
[[nodiscard]] std::string generate_consumer_id();

/**
 * @brief Get a human-readable hostname
 *
 * @return The system hostname or "unknown" on failure
 */
[[nodiscard]] std::string get_hostname();

}  // namespace identity
}  // namespace stillhere
