#include "util/crc32c.h"

#include <array>

namespace stratum::util
{
    namespace
    {
        constexpr std::uint32_t kCastagnoliReversed = 0x82F63B78u;

        constexpr std::array<std::uint32_t, 256> BuildTable()
        {
            std::array<std::uint32_t, 256> t{};
            for (std::uint32_t i = 0; i < 256; ++i)
            {
                std::uint32_t c = i;
                for (int bit = 0; bit < 8; ++bit)
                    c = (c & 1u) ? (c >> 1) ^ kCastagnoliReversed : (c >> 1);
                t[i] = c;
            }
            return t;
        }

        constexpr std::array<std::uint32_t, 256> kTable = BuildTable();
    } // namespace

    std::uint32_t Crc32c(const void *data, std::size_t n, std::uint32_t seed)
    {
        std::uint32_t crc = ~seed;
        const auto *p = static_cast<const std::uint8_t *>(data);
        for (std::size_t i = 0; i < n; ++i)
            crc = kTable[(crc ^ p[i]) & 0xFFu] ^ (crc >> 8);
        return ~crc;
    }

} // namespace stratum::util
