/**
 * chunkup - Hashing and randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace chunkup::crypto
{

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_string(std::string_view text);

    // Hex encoding of `byte_count` bytes from the libsodium CSPRNG.
    std::string random_hex(std::size_t byte_count);

} // namespace chunkup::crypto
