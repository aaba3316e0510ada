#pragma once

#include <cstdint>
#include <optional>

namespace sheetlens {
namespace format {

/**
 * @brief 工作簿的日期系统
 *
 * 1900 系统保留 Excel 的闰年错误：序列号 60 对应不存在的 1900-02-29。
 * 1904 系统以 1904-01-01 为序列号 0。
 */
enum class DateSystem : uint8_t {
    Excel1900 = 0,
    Excel1904 = 1
};

struct DateTime {
    int year = 1900;
    int month = 1;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
    int weekday = 0;   // 0 = 星期日
};

/**
 * @brief 序列号转换为日历时间
 *
 * 整数部分为天，小数部分为一天中的时间（精确到毫秒）。
 * @return 负数或超过 9999-12-31 时返回 nullopt
 */
std::optional<DateTime> serialToDateTime(double serial, DateSystem system);

/**
 * @brief 日期转换为序列号（不含时间部分）
 *
 * 1900 系统中 1900-02-29 返回 60。
 */
double dateToSerial(int year, int month, int day, DateSystem system);

/**
 * @brief 时分秒转换为一天中的比例
 */
double timeToFraction(int hour, int minute, double second);

// 公历与儒略日数互转
int64_t civilToJulianDay(int year, int month, int day);
void julianDayToCivil(int64_t jdn, int& year, int& month, int& day);

}} // namespace sheetlens::format
