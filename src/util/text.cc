#include "util/text.h"

#include <ctime>

namespace stratum::util
{
    namespace
    {
        constexpr char kHex[] = "0123456789ABCDEF";

        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }
    } // namespace

    std::string EscapeField(std::string_view in)
    {
        if (in.empty())
            return "%";
        std::string out;
        out.reserve(in.size());
        for (unsigned char c : in)
        {
            if (c <= 0x20 || c >= 0x7F || c == '%')
            {
                out += '%';
                out += kHex[c >> 4];
                out += kHex[c & 0xF];
            }
            else
            {
                out += static_cast<char>(c);
            }
        }
        return out;
    }

    bool UnescapeField(std::string_view in, std::string *out)
    {
        out->clear();
        // A lone '%' is the empty string.
        if (in == "%")
            return true;
        for (std::size_t i = 0; i < in.size(); ++i)
        {
            if (in[i] != '%')
            {
                *out += in[i];
                continue;
            }
            if (i + 2 >= in.size())
                return false;
            int hi = HexValue(in[i + 1]);
            int lo = HexValue(in[i + 2]);
            if (hi < 0 || lo < 0)
                return false;
            *out += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return true;
    }

    std::vector<std::string_view> SplitWs(std::string_view line)
    {
        std::vector<std::string_view> out;
        std::size_t i = 0;
        while (i < line.size())
        {
            while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r'))
                ++i;
            if (i >= line.size())
                break;
            std::size_t j = i;
            while (j < line.size() && line[j] != ' ' && line[j] != '\t' && line[j] != '\r')
                ++j;
            out.push_back(line.substr(i, j - i));
            i = j;
        }
        return out;
    }

    std::string_view Trim(std::string_view s)
    {
        std::size_t a = 0;
        while (a < s.size() && (s[a] == ' ' || s[a] == '\t'))
            ++a;
        std::size_t b = s.size();
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n'))
            --b;
        return s.substr(a, b - a);
    }

    bool ParseU64(std::string_view tok, std::uint64_t *out)
    {
        if (tok.empty() || tok.size() > 20)
            return false;
        std::uint64_t v = 0;
        for (char ch : tok)
        {
            if (ch < '0' || ch > '9')
                return false;
            std::uint64_t d = static_cast<std::uint64_t>(ch - '0');
            if (v > (UINT64_MAX - d) / 10)
                return false;
            v = v * 10 + d;
        }
        *out = v;
        return true;
    }

    std::string FormatTimestamp(std::uint64_t epoch_seconds)
    {
        std::time_t t = static_cast<std::time_t>(epoch_seconds);
        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm_buf);
        return buf;
    }

} // namespace stratum::util
