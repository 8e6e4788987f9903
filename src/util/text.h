#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stratum::util
{

    // Percent-encodes whitespace, '%' and non-printables so a value fits in one
    // whitespace-separated field.
    std::string EscapeField(std::string_view in);
    bool UnescapeField(std::string_view in, std::string *out);

    std::vector<std::string_view> SplitWs(std::string_view line);
    std::string_view Trim(std::string_view s);

    bool ParseU64(std::string_view tok, std::uint64_t *out);

    // 1760000000 -> "20251009-085320" (UTC).
    std::string FormatTimestamp(std::uint64_t epoch_seconds);

} // namespace stratum::util
