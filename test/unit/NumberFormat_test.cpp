#include "sheetlens/format/NumberFormat.hpp"
#include "sheetlens/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace sheetlens {
namespace format {

class NumberFormatTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/NumberFormat_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
    }

    static std::string fmt1900(double value, const std::string& code) {
        return formatNumber(value, code, DateSystem::Excel1900);
    }
};

// 测试1: General 格式
TEST_F(NumberFormatTest, GeneralFormat) {
    EXPECT_EQ(formatGeneral(0), "0");
    EXPECT_EQ(formatGeneral(42), "42");
    EXPECT_EQ(formatGeneral(-5), "-5");
    EXPECT_EQ(formatGeneral(1234.5), "1234.5");
    EXPECT_EQ(formatGeneral(1.0 / 3.0), "0.3333333333");
    EXPECT_EQ(formatGeneral(1e12), "1E+12");

    NumberFormat general("General");
    EXPECT_TRUE(general.isGeneral());
    EXPECT_FALSE(general.isDate());
    EXPECT_EQ(general.format(42), "42");
}

// 测试2: 千分位与小数位
TEST_F(NumberFormatTest, ThousandsAndDecimals) {
    EXPECT_EQ(fmt1900(1234.5, "#,##0.00"), "1,234.50");
    EXPECT_EQ(fmt1900(-1234.5, "#,##0.00"), "-1,234.50");
    EXPECT_EQ(fmt1900(0, "#,##0"), "0");
    EXPECT_EQ(fmt1900(0.5, "0.00"), "0.50");
    EXPECT_EQ(fmt1900(42, "00000"), "00042");
    EXPECT_EQ(fmt1900(1234.5, "$#,##0.00"), "$1,234.50");
}

// 测试3: 末尾逗号缩放
TEST_F(NumberFormatTest, TrailingCommaScales) {
    EXPECT_EQ(fmt1900(1234567, "#,##0,\"K\""), "1,235K");
}

// 测试4: 百分比
TEST_F(NumberFormatTest, Percent) {
    EXPECT_EQ(fmt1900(0.25, "0%"), "25%");
    EXPECT_EQ(fmt1900(0.1234, "0.00%"), "12.34%");
}

// 测试5: 科学计数法
TEST_F(NumberFormatTest, Scientific) {
    EXPECT_EQ(fmt1900(12345, "0.00E+00"), "1.23E+04");
    EXPECT_EQ(fmt1900(0.00012345, "0.00E+00"), "1.23E-04");
}

// 测试6: 分数
TEST_F(NumberFormatTest, Fraction) {
    EXPECT_EQ(fmt1900(1.5, "# ?/?"), "1 1/2");
    EXPECT_EQ(fmt1900(0.75, "# ?/?"), "3/4");
    // 固定分母
    EXPECT_EQ(fmt1900(1.5, "# ?/8"), "1 4/8");
    EXPECT_EQ(fmt1900(1.25, "# ?/10"), "1 3/10");
    EXPECT_EQ(fmt1900(0.37, "# ??/100"), "37/100");
    EXPECT_EQ(fmt1900(0.5, "??/100"), "50/100");
    EXPECT_EQ(fmt1900(0.25, "# ?/4\"x\""), "1/4x");
}

// 测试7: 分段，负数段不再输出负号
TEST_F(NumberFormatTest, Sections) {
    EXPECT_EQ(fmt1900(-1234.5, "#,##0.00;(#,##0.00)"), "(1,234.50)");
    EXPECT_EQ(fmt1900(1234.5, "#,##0.00;(#,##0.00)"), "1,234.50");
    EXPECT_EQ(fmt1900(0, "0.00;-0.00;\"zero\""), "zero");
    // 颜色段不影响文本
    EXPECT_EQ(fmt1900(-5, "[Red]0.00"), "-5.00");
    // 文本段格式化数值时按 General
    EXPECT_EQ(fmt1900(12, "@"), "12");
}

// 测试8: 日期和时间
TEST_F(NumberFormatTest, DateAndTime) {
    EXPECT_EQ(fmt1900(60, "yyyy-mm-dd"), "1900-02-29");
    EXPECT_EQ(fmt1900(45292, "d-mmm-yy"), "1-Jan-24");
    EXPECT_EQ(fmt1900(45292.5, "yyyy-mm-dd hh:mm:ss"), "2024-01-01 12:00:00");
    EXPECT_EQ(fmt1900(0.75, "h:mm AM/PM"), "6:00 PM");
    EXPECT_EQ(fmt1900(1.5, "[h]:mm:ss"), "36:00:00");
}

// 测试9: 1904 日期系统
TEST_F(NumberFormatTest, DateSystem1904) {
    EXPECT_EQ(formatNumber(0, "yyyy-mm-dd", DateSystem::Excel1904), "1904-01-01");
    NumberFormat code("yyyy-mm-dd");
    EXPECT_EQ(code.format(1, DateSystem::Excel1904), "1904-01-02");
}

// 测试10: 日期格式识别
TEST_F(NumberFormatTest, DetectDateFormat) {
    EXPECT_TRUE(isDateFormat("yyyy-mm-dd"));
    EXPECT_TRUE(isDateFormat("[h]:mm:ss"));
    EXPECT_TRUE(isDateFormat("mm:ss"));
    EXPECT_FALSE(isDateFormat("0.00"));
    EXPECT_FALSE(isDateFormat("#,##0"));
    EXPECT_FALSE(isDateFormat("General"));

    EXPECT_TRUE(NumberFormat("d-mmm-yy").isDate());
    EXPECT_FALSE(NumberFormat("0.00%").isDate());
}

// 测试11: 内置格式表
TEST_F(NumberFormatTest, BuiltinFormats) {
    EXPECT_EQ(builtinFormatCode(0), "General");
    EXPECT_EQ(builtinFormatCode(14), "mm-dd-yy");
    EXPECT_EQ(builtinFormatCode(49), "@");
    EXPECT_FALSE(builtinFormatCode(23).has_value());
    EXPECT_FALSE(builtinFormatCode(100).has_value());
}

// 测试12: 缓存只编译一次
TEST_F(NumberFormatTest, CacheCompilesOnce) {
    NumberFormatCache cache;
    const NumberFormat& first = cache.get("#,##0.00");
    const NumberFormat& second = cache.get("#,##0.00");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(cache.size(), 1u);

    EXPECT_EQ(cache.format(1234.5, "#,##0.00"), "1,234.50");
    EXPECT_EQ(cache.format(0.25, "0%"), "25%");
    EXPECT_EQ(cache.size(), 2u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

}} // namespace sheetlens::format
