#include "TimeUtils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
std::time_t Timegm(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

bool ParseTwoDigits(const std::string& value, size_t pos, int& out) {
    if (pos + 2 > value.size()
        || !std::isdigit(static_cast<unsigned char>(value[pos]))
        || !std::isdigit(static_cast<unsigned char>(value[pos + 1]))) {
        return false;
    }
    out = (value[pos] - '0') * 10 + (value[pos + 1] - '0');
    return true;
}
} // namespace

std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& value) {
    constexpr size_t kDateTimeLength = 19;
    if (value.size() < kDateTimeLength) {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream stream(value.substr(0, kDateTimeLength));
    stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }

    size_t pos = kDateTimeLength;
    long long fractionMicros = 0;
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        long long scale = 100000;
        const size_t digitsStart = pos;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            fractionMicros += (value[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == digitsStart) {
            return std::nullopt;
        }
    }

    long offsetSeconds = 0;
    if (pos < value.size()) {
        const char designator = value[pos];
        if (designator == 'Z' || designator == 'z') {
            ++pos;
        } else if (designator == '+' || designator == '-') {
            int hours = 0;
            int minutes = 0;
            if (!ParseTwoDigits(value, pos + 1, hours)) {
                return std::nullopt;
            }
            size_t minutesPos = pos + 3;
            if (minutesPos < value.size() && value[minutesPos] == ':') {
                ++minutesPos;
            }
            if (!ParseTwoDigits(value, minutesPos, minutes)) {
                return std::nullopt;
            }
            offsetSeconds = (hours * 3600L + minutes * 60L) * (designator == '-' ? -1 : 1);
            pos = minutesPos + 2;
        } else {
            return std::nullopt;
        }
    }

    if (pos != value.size()) {
        return std::nullopt;
    }

    const std::time_t utc = Timegm(&tm) - offsetSeconds;
    return std::chrono::system_clock::from_time_t(utc) + std::chrono::microseconds(fractionMicros);
}

std::string FormatIso8601(std::chrono::system_clock::time_point time) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch() % std::chrono::seconds(1)).count();
    std::tm utcTime = {};
#ifdef _WIN32
    gmtime_s(&utcTime, &seconds);
#else
    gmtime_r(&seconds, &utcTime);
#endif

    std::ostringstream output;
    output << std::put_time(&utcTime, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? 0 : millis) << 'Z';
    return output.str();
}
