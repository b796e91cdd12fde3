/**
 * @file encoding.cpp
 * @brief Hex, base64 and base64url encodings, RFC 3339 timestamps
 */

#include "axiom/common.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <string>

#include <openssl/evp.h>

namespace axiom::common {

namespace {

[[nodiscard]] bool parse_fixed_int(std::string_view text, int& out)
{
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

}  // namespace

std::string to_hex(std::string_view bytes)
{
    std::string result;
    result.reserve(bytes.size() * 2uz);
    for (char c : bytes) {
        result += std::format("{:02x}", static_cast<unsigned char>(c));
    }
    return result;
}

bool is_hex_digest(std::string_view text, std::size_t length)
{
    return text.size() == length && std::ranges::all_of(text, [](char c) noexcept {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

std::string base64_encode(std::string_view bytes)
{
    if (bytes.empty()) {
        return {};
    }
    std::string out(4uz * ((bytes.size() + 2uz) / 3uz), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(bytes.data()),
                                        static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Result<std::string> base64_decode(std::string_view text)
{
    if (text.empty()) {
        return std::string{};
    }
    if (text.size() % 4uz != 0uz) {
        return std::unexpected(
            Error::make(errc::kParse, "base64 input length is not a multiple of 4"));
    }
    std::string out(3uz * (text.size() / 4uz), '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::unexpected(Error::make(errc::kParse, "Invalid base64 input"));
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (text.ends_with("==")) {
        padding = 2;
    } else if (text.ends_with('=')) {
        padding = 1;
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string base64url_encode(std::string_view bytes)
{
    std::string out = base64_encode(bytes);
    std::ranges::replace(out, '+', '-');
    std::ranges::replace(out, '/', '_');
    while (out.ends_with('=')) {
        out.pop_back();
    }
    return out;
}

Result<std::string> base64url_decode(std::string_view text)
{
    std::string standard(text);
    if (standard.find_first_of("+/") != std::string::npos) {
        return std::unexpected(Error::make(errc::kParse, "Invalid base64url alphabet"));
    }
    std::ranges::replace(standard, '-', '+');
    std::ranges::replace(standard, '_', '/');
    while (standard.size() % 4uz != 0uz) {
        standard.push_back('=');
    }
    return base64_decode(standard);
}

std::string format_rfc3339(WallClock::time_point tp)
{
    using namespace std::chrono;
    const auto secs = floor<seconds>(tp);
    const auto day = floor<days>(secs);
    const year_month_day ymd{day};
    const hh_mm_ss hms{secs - day};
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

Result<WallClock::time_point> parse_rfc3339(std::string_view text)
{
    // YYYY-MM-DDTHH:MM:SSZ
    constexpr std::size_t kLength = 20;
    if (text.size() != kLength || text[4] != '-' || text[7] != '-' || text[10] != 'T'
        || text[13] != ':' || text[16] != ':' || text[19] != 'Z') {
        return std::unexpected(
            Error::make(errc::kParse, "Timestamp is not RFC 3339 UTC: " + std::string(text)));
    }
    int y = 0;
    int mo = 0;
    int d = 0;
    int h = 0;
    int mi = 0;
    int s = 0;
    if (!parse_fixed_int(text.substr(0, 4), y) || !parse_fixed_int(text.substr(5, 2), mo)
        || !parse_fixed_int(text.substr(8, 2), d) || !parse_fixed_int(text.substr(11, 2), h)
        || !parse_fixed_int(text.substr(14, 2), mi) || !parse_fixed_int(text.substr(17, 2), s)) {
        return std::unexpected(
            Error::make(errc::kParse, "Timestamp has non-numeric fields: " + std::string(text)));
    }

    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::unexpected(
            Error::make(errc::kParse, "Timestamp is out of range: " + std::string(text)));
    }
    return WallClock::time_point{sys_days{ymd} + hours{h} + minutes{mi} + seconds{s}};
}

}  // namespace axiom::common
