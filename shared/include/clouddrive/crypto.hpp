/**
 * clouddrive - Hashing helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace clouddrive::crypto
{

    // Lowercase hex SHA-256.
    std::string sha256_hex(std::span<const std::byte> data);

    std::string sha256_hex(std::string_view text);

    // Stable key for a (local, remote) transfer pair. Each part is hashed behind its decimal
    // length, so no choice of separator characters can make two pairs collide.
    std::string transfer_fingerprint(std::string_view local_resource_id, std::string_view remote_resource_id);

} // namespace clouddrive::crypto
