#include <finbot/util/crc32c.h>

#include <array>

namespace finbot::util
{
    namespace
    {
        constexpr std::uint32_t kPoly = 0x82F63B78u; // reversed Castagnoli

        constexpr std::uint32_t TableAt(std::uint32_t i)
        {
            std::uint32_t crc = i;
            for (int k = 0; k < 8; ++k)
                crc = (crc >> 1) ^ (kPoly & (~(crc & 1u) + 1u));
            return crc;
        }

        constexpr std::array<std::uint32_t, 256> MakeTable()
        {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t i = 0; i < 256; ++i)
                table[i] = TableAt(i);
            return table;
        }

        constexpr std::array<std::uint32_t, 256> kTable = MakeTable();
    } // namespace

    std::uint32_t Crc32cExtend(std::uint32_t crc, const void *data, std::size_t n)
    {
        std::uint32_t c = ~crc;
        const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
        for (std::size_t i = 0; i < n; ++i)
        {
            c = kTable[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
        }
        return ~c;
    }

    std::uint32_t Crc32c(const void *data, std::size_t n)
    {
        return Crc32cExtend(0u, data, n);
    }

} // namespace finbot::util
