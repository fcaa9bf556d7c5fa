#include "clouddrive/crypto.hpp"

#include <array>
#include <initializer_list>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace clouddrive::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    std::string sha256_hex(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()),
                               static_cast<unsigned long long>(data.size())) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::string sha256_hex(std::string_view text)
    {
        return sha256_hex(std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string transfer_fingerprint(std::string_view local_resource_id, std::string_view remote_resource_id)
    {
        ensure_initialized_once();
        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
        for (const auto part : {local_resource_id, remote_resource_id})
        {
            const auto prefix = std::to_string(part.size()) + ":";
            if (crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char *>(prefix.data()),
                                          prefix.size()) != 0 ||
                crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char *>(part.data()),
                                          part.size()) != 0)
            {
                throw std::runtime_error("crypto_hash_sha256_update failed");
            }
        }
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(&state, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return to_hex(digest);
    }

} // namespace clouddrive::crypto
