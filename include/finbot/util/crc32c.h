#pragma once
#include <cstddef>
#include <cstdint>

namespace finbot::util
{
    // CRC32C (Castagnoli) of a buffer.
    std::uint32_t Crc32c(const void *data, std::size_t n);

    // Continue a CRC over more bytes, for streaming writes.
    std::uint32_t Crc32cExtend(std::uint32_t crc, const void *data, std::size_t n);
}
