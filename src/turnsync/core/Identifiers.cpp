#include "core/Identifiers.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace TS {

namespace {

bool gmtime_utc(std::time_t value, std::tm& out) {
#if defined(_WIN32)
    return gmtime_s(&out, &value) == 0;
#else
    return gmtime_r(&value, &out) != nullptr;
#endif
}

} // namespace

auto generateUuid() -> std::string {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    auto high = dist(engine);
    auto low  = dist(engine);
    // version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low  = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    oss << std::setw(8) << (high >> 32) << '-';
    oss << std::setw(4) << ((high >> 16) & 0xFFFFULL) << '-';
    oss << std::setw(4) << (high & 0xFFFFULL) << '-';
    oss << std::setw(4) << (low >> 48) << '-';
    oss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

auto isUuid(std::string_view text) -> bool {
    if (text.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto const ch = static_cast<unsigned char>(text[i]);
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (ch != '-') {
                return false;
            }
            continue;
        }
        if (std::isxdigit(ch) == 0) {
            return false;
        }
    }
    return true;
}

auto formatTimestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis       = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds_part);
    std::time_t raw   = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm tm{};
    if (!gmtime_utc(raw, tm)) {
        return "1970-01-01T00:00:00.000Z";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << millis.count();
    oss << 'Z';
    return oss.str();
}

auto nowTimestamp() -> std::string {
    return formatTimestamp(std::chrono::system_clock::now());
}

auto toMillis(std::chrono::system_clock::time_point tp) -> std::uint64_t {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

} // namespace TS
