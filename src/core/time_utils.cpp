#include <hoard/core/time_utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hoard::time_utils {

namespace {

std::optional<TimePoint> fromUtcTm(std::tm& tm) {
    const std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace

std::optional<TimePoint> parseTimestamp(std::string_view text) {
    std::string s(text);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    if (s.empty()) {
        return std::nullopt;
    }

    if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            return fromEpochSeconds(std::stoll(s));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    if (!s.empty() && s.back() == 'Z') {
        s.pop_back();
    }

    {
        std::tm tm = {};
        std::istringstream ss(s);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (!ss.fail() && ss.peek() == std::char_traits<char>::eof()) {
            return fromUtcTm(tm);
        }
    }

    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return fromUtcTm(tm);
}

std::string formatIsoUtc(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    ::gmtime_r(&t, &tm);
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

std::string nowIsoUtc() {
    return formatIsoUtc(std::chrono::system_clock::now());
}

std::int64_t toEpochSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochSeconds(std::int64_t seconds) {
    return TimePoint{std::chrono::seconds(seconds)};
}

std::string formatHms(std::chrono::seconds elapsed) {
    auto total = std::max<std::int64_t>(0, elapsed.count());
    const auto hours = total / 3600;
    total %= 3600;
    return fmt::format("{:02d}:{:02d}:{:02d}", hours, total / 60, total % 60);
}

} // namespace hoard::time_utils
