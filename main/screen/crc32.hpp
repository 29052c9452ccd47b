/**
 * @file crc32.hpp
 * @brief CRC32-IEEE used for settings blobs and frame fingerprints.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace roundscreen {

/**
 * @brief Compute CRC32-IEEE checksum
 * @param data Data buffer
 * @param len Data length in bytes
 * @param crc Running value from a previous call (omit for a fresh checksum)
 * @return CRC32 checksum value
 */
inline uint32_t Crc32Ieee(const uint8_t* data, size_t len, uint32_t crc = 0) noexcept
{
    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            const uint32_t mask = -(crc & 1u);
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    }
    return ~crc;
}

} // namespace roundscreen
