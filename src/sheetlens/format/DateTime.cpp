#include "sheetlens/format/DateTime.hpp"

#include <cmath>

namespace sheetlens {
namespace format {

namespace {

// 序列号 1 (1900-01-01) 与 1904 系统序列号 0 的儒略日偏移
constexpr int64_t kEpoch1900BeforeBug = 2415020;
constexpr int64_t kEpoch1900AfterBug = 2415019;
constexpr int64_t kEpoch1904 = 2416481;

constexpr double kMaxSerial = 2958465.0;          // 9999-12-31
constexpr int64_t kMillisPerDay = 86400000;

} // namespace

int64_t civilToJulianDay(int year, int month, int day) {
    const int64_t a = (14 - month) / 12;
    const int64_t y = static_cast<int64_t>(year) + 4800 - a;
    const int64_t m = month + 12 * a - 3;
    return day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
}

void julianDayToCivil(int64_t jdn, int& year, int& month, int& day) {
    const int64_t a = jdn + 32044;
    const int64_t b = (4 * a + 3) / 146097;
    const int64_t c = a - 146097 * b / 4;
    const int64_t d = (4 * c + 3) / 1461;
    const int64_t e = c - 1461 * d / 4;
    const int64_t m = (5 * e + 2) / 153;
    day = static_cast<int>(e - (153 * m + 2) / 5 + 1);
    month = static_cast<int>(m + 3 - 12 * (m / 10));
    year = static_cast<int>(100 * b + d - 4800 + m / 10);
}

std::optional<DateTime> serialToDateTime(double serial, DateSystem system) {
    if (!std::isfinite(serial) || serial < 0.0 || serial > kMaxSerial + 1.0) {
        return std::nullopt;
    }

    int64_t days = static_cast<int64_t>(std::floor(serial));
    int64_t millis = static_cast<int64_t>(std::llround((serial - static_cast<double>(days)) * kMillisPerDay));
    if (millis >= kMillisPerDay) {
        ++days;
        millis -= kMillisPerDay;
    }
    if (static_cast<double>(days) > kMaxSerial) {
        return std::nullopt;
    }

    DateTime dt;
    if (system == DateSystem::Excel1900) {
        if (days == 0) {
            dt.year = 1900;
            dt.month = 1;
            dt.day = 0;
        } else if (days == 60) {
            dt.year = 1900;
            dt.month = 2;
            dt.day = 29;
        } else {
            const int64_t jdn = days < 60 ? days + kEpoch1900BeforeBug : days + kEpoch1900AfterBug;
            julianDayToCivil(jdn, dt.year, dt.month, dt.day);
        }
        // Excel 认为 1900-01-01 是星期日
        dt.weekday = static_cast<int>((days + 6) % 7);
    } else {
        const int64_t jdn = days + kEpoch1904;
        julianDayToCivil(jdn, dt.year, dt.month, dt.day);
        dt.weekday = static_cast<int>((jdn + 1) % 7);
    }

    dt.hour = static_cast<int>(millis / 3600000);
    dt.minute = static_cast<int>((millis / 60000) % 60);
    dt.second = static_cast<int>((millis / 1000) % 60);
    dt.millisecond = static_cast<int>(millis % 1000);
    return dt;
}

double dateToSerial(int year, int month, int day, DateSystem system) {
    const int64_t jdn = civilToJulianDay(year, month, day);
    if (system == DateSystem::Excel1904) {
        return static_cast<double>(jdn - kEpoch1904);
    }
    if (year == 1900 && month == 2 && day == 29) {
        return 60.0;
    }
    const int64_t before = jdn - kEpoch1900BeforeBug;
    if (before < 60) {
        return static_cast<double>(before);
    }
    return static_cast<double>(jdn - kEpoch1900AfterBug);
}

double timeToFraction(int hour, int minute, double second) {
    return (hour * 3600.0 + minute * 60.0 + second) / 86400.0;
}

}} // namespace sheetlens::format
