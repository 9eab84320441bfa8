#include "core/util/Timestamp.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <sstream>

namespace reconpulse::core {

namespace {

class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {}

    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }

    bool consume(char expected) {
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    std::optional<int> digits(size_t count) {
        if (pos_ + count > text_.size()) {
            return std::nullopt;
        }
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        return value;
    }

    std::optional<std::chrono::nanoseconds> fraction() {
        int64_t value = 0;
        int scale = 0;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            if (scale < 9) {
                value = value * 10 + (peek() - '0');
                ++scale;
            }
            ++pos_;
        }
        if (scale == 0) {
            return std::nullopt;
        }
        for (; scale < 9; ++scale) {
            value *= 10;
        }
        return std::chrono::nanoseconds{value};
    }

private:
    const std::string& text_;
    size_t pos_{0};
};

constexpr std::array<const char*, 12> kMonthNames = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

std::optional<std::chrono::sys_days> makeDate(int year, int month, int day) {
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

} // namespace

std::optional<TimePoint> parseIsoTimestamp(const std::string& text) {
    using namespace std::chrono;

    Cursor cursor(text);
    auto year = cursor.digits(4);
    if (!year || !cursor.consume('-')) {
        return std::nullopt;
    }
    auto month = cursor.digits(2);
    if (!month || !cursor.consume('-')) {
        return std::nullopt;
    }
    auto day = cursor.digits(2);
    if (!day) {
        return std::nullopt;
    }

    auto date = makeDate(*year, *month, *day);
    if (!date) {
        return std::nullopt;
    }

    system_clock::duration timeOfDay{0};
    if (cursor.consume('T') || cursor.consume(' ')) {
        auto hour = cursor.digits(2);
        if (!hour || !cursor.consume(':')) {
            return std::nullopt;
        }
        auto minute = cursor.digits(2);
        if (!minute) {
            return std::nullopt;
        }
        int second = 0;
        nanoseconds fractional{0};
        if (cursor.consume(':')) {
            auto sec = cursor.digits(2);
            if (!sec) {
                return std::nullopt;
            }
            second = *sec;
            if (cursor.consume('.')) {
                auto frac = cursor.fraction();
                if (!frac) {
                    return std::nullopt;
                }
                fractional = *frac;
            }
        }
        if (*hour > 23 || *minute > 59 || second > 59) {
            return std::nullopt;
        }
        timeOfDay = duration_cast<system_clock::duration>(hours{*hour} + minutes{*minute} +
                                                          seconds{second} + fractional);
    }

    minutes offset{0};
    if (cursor.consume('Z')) {
        // UTC
    } else if (cursor.peek() == '+' || cursor.peek() == '-') {
        int sign = cursor.peek() == '-' ? -1 : 1;
        cursor.consume(cursor.peek());
        auto offHours = cursor.digits(2);
        if (!offHours) {
            return std::nullopt;
        }
        cursor.consume(':');
        auto offMinutes = cursor.digits(2);
        if (!offMinutes || *offHours > 23 || *offMinutes > 59) {
            return std::nullopt;
        }
        offset = sign * (hours{*offHours} + minutes{*offMinutes});
    }

    if (!cursor.atEnd()) {
        return std::nullopt;
    }

    return TimePoint{*date} + timeOfDay - offset;
}

std::string formatIsoTimestamp(TimePoint instant) {
    using namespace std::chrono;

    auto secs = floor<seconds>(instant);
    auto day = floor<days>(secs);
    year_month_day ymd{day};
    hh_mm_ss hms{secs - day};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}+00:00", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

std::string formatFileTimestamp(TimePoint instant) {
    std::time_t t = std::chrono::system_clock::to_time_t(instant);
    std::tm local{};
    localtime_r(&t, &local);

    std::array<char, 32> buffer{};
    std::strftime(buffer.data(), buffer.size(), "%Y%m%d_%H%M%S", &local);
    return buffer.data();
}

std::optional<std::string> certTimeToIso(const std::optional<std::string>& certTime) {
    if (!certTime || certTime->empty()) {
        return std::nullopt;
    }

    std::istringstream stream(*certTime);
    std::string monthName;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int year = 0;
    char sep1 = 0;
    char sep2 = 0;
    std::string zone;
    std::string trailing;

    stream >> monthName >> day >> hour >> sep1 >> minute >> sep2 >> second >> year >> zone;
    if (stream.fail() || sep1 != ':' || sep2 != ':' || (stream >> trailing)) {
        return certTime;
    }
    if (zone != "GMT" && zone != "UTC") {
        return certTime;
    }

    int month = 0;
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        if (monthName == kMonthNames[i]) {
            month = static_cast<int>(i) + 1;
            break;
        }
    }
    if (month == 0 || hour > 23 || minute > 59 || second > 59) {
        return certTime;
    }

    auto date = makeDate(year, month, day);
    if (!date) {
        return certTime;
    }

    using namespace std::chrono;
    return formatIsoTimestamp(TimePoint{*date} + hours{hour} + minutes{minute} + seconds{second});
}

} // namespace reconpulse::core
