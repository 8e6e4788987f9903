#pragma once
#include <cstddef>
#include <cstdint>

namespace stratum::util
{

    // CRC32C (Castagnoli), table driven. Guards the persisted state record.
    std::uint32_t Crc32c(const void *data, std::size_t n, std::uint32_t seed = 0);

} // namespace stratum::util
