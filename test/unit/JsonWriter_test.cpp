#include "sheetlens/cli/JsonWriter.hpp"
#include "sheetlens/cli/WorkbookJson.hpp"
#include "sheetlens/core/Exception.hpp"
#include "sheetlens/reader/XLSXReader.hpp"
#include "sheetlens/utils/Logger.hpp"
#include "TestPackage.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace sheetlens {
namespace cli {

class JsonWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/JsonWriter_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
    }

    // 辅助函数：断言 json 中包含片段
    static void expectContains(const std::string& json, const std::string& fragment) {
        EXPECT_NE(json.find(fragment), std::string::npos) << "missing: " << fragment << "\nin: " << json;
    }
};

// 测试1: 紧凑输出
TEST_F(JsonWriterTest, CompactOutput) {
    JsonWriter writer;
    writer.beginObject();
    writer.field("a", "x");
    writer.field("n", 1.5);
    writer.field("i", 3);
    writer.field("b", true);
    writer.key("z");
    writer.null();
    writer.key("arr");
    writer.beginArray();
    writer.value(1);
    writer.value(uint64_t(18446744073709551615ull));
    writer.endArray();
    writer.endObject();

    EXPECT_TRUE(writer.complete());
    EXPECT_EQ(writer.takeResult(),
              "{\"a\":\"x\",\"n\":1.5,\"i\":3,\"b\":true,\"z\":null,\"arr\":[1,18446744073709551615]}");
}

// 测试2: 缩进输出
TEST_F(JsonWriterTest, PrettyOutput) {
    JsonWriter writer(true);
    writer.beginObject();
    writer.field("a", 1);
    writer.key("list");
    writer.beginArray();
    writer.value(true);
    writer.endArray();
    writer.key("empty");
    writer.beginObject();
    writer.endObject();
    writer.endObject();

    EXPECT_EQ(writer.takeResult(),
              "{\n"
              "  \"a\": 1,\n"
              "  \"list\": [\n"
              "    true\n"
              "  ],\n"
              "  \"empty\": {}\n"
              "}\n");
}

// 测试3: 字符串转义
TEST_F(JsonWriterTest, Escaping) {
    EXPECT_EQ(JsonWriter::escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(JsonWriter::escape("line\nnext\ttab\r"), "line\\nnext\\ttab\\r");
    EXPECT_EQ(JsonWriter::escape(std::string("\x01\x1f", 2)), "\\u0001\\u001f");
    // 非 ASCII 原样输出
    EXPECT_EQ(JsonWriter::escape("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(JsonWriter::escape("\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");
    // 非法 UTF-8 替换为 U+FFFD
    EXPECT_EQ(JsonWriter::escape("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
}

// 测试4: 非有限数写为 null
TEST_F(JsonWriterTest, NonFiniteNumbers) {
    JsonWriter writer;
    writer.beginArray();
    writer.value(std::numeric_limits<double>::quiet_NaN());
    writer.value(std::numeric_limits<double>::infinity());
    writer.value(-0.25);
    writer.endArray();
    EXPECT_EQ(writer.takeResult(), "[null,null,-0.25]");
}

// 测试5: 误用抛出异常
TEST_F(JsonWriterTest, MisuseThrows) {
    {
        JsonWriter writer;
        writer.beginObject();
        EXPECT_THROW(writer.value(1), core::SheetLensException);
    }
    {
        JsonWriter writer;
        EXPECT_THROW(writer.key("k"), core::SheetLensException);
        writer.beginArray();
        EXPECT_THROW(writer.key("k"), core::SheetLensException);
        EXPECT_THROW(writer.endObject(), core::SheetLensException);
    }
    {
        JsonWriter writer;
        writer.beginObject();
        writer.key("k");
        EXPECT_THROW(writer.key("again"), core::SheetLensException);
        EXPECT_THROW(writer.endObject(), core::SheetLensException);
        EXPECT_THROW(writer.takeResult(), core::SheetLensException);
    }
    {
        JsonWriter writer;
        writer.value(1);
        EXPECT_THROW(writer.value(2), core::SheetLensException);
    }
}

// 测试6: 颜色与样式
TEST_F(JsonWriterTest, StyleJson) {
    EXPECT_EQ(colorToHex(0x4472C4), "#4472C4");
    EXPECT_EQ(colorToHex(0xAB), "#0000AB");

    core::Style style;
    style.font_family = "Arial";
    style.bold = true;
    style.bg_color = 0xFFFF00;
    style.border_left = core::BorderSide{core::BorderStyle::Thin, 0xFF0000};
    style.align_h = core::HorizontalAlign::Center;
    style.number_format = "0.00";
    style.number_format_id = 164;

    JsonWriter writer;
    writeStyle(writer, style);
    EXPECT_EQ(writer.takeResult(),
              "{\"fontFamily\":\"Arial\",\"bold\":true,\"bgColor\":\"#FFFF00\","
              "\"borderLeft\":{\"style\":\"thin\",\"color\":\"#FF0000\"},"
              "\"alignH\":\"center\",\"numberFormat\":\"0.00\",\"numberFormatId\":164}");
}

// 测试7: 条件格式规则
TEST_F(JsonWriterTest, ConditionalFormatRules) {
    core::Workbook workbook;
    core::Sheet sheet;
    sheet.name = "CF";

    core::CfRule scale;
    scale.type = core::CfRuleType::ColorScale;
    scale.type_name = "colorScale";
    scale.priority = 1;
    scale.color_scale.emplace();
    core::Cfvo min;
    min.type = core::Cfvo::Type::Min;
    core::Cfvo max;
    max.type = core::Cfvo::Type::Max;
    scale.color_scale->cfvos = {min, max};
    scale.color_scale->colors = {core::Color(0xF8696B), core::Color::fromTheme(4)};

    core::CfRule top;
    top.type = core::CfRuleType::Top10;
    top.type_name = "top10";
    top.priority = 2;
    top.stop_if_true = true;
    top.dxf_id = 0;

    core::ConditionalFormat group;
    group.sqref = "A1:A10";
    group.ranges.push_back(core::CellRange(0, 0, 9, 0));
    group.rules = {scale, top};
    sheet.conditional_formats.push_back(group);
    workbook.sheets.push_back(sheet);

    const std::string json = workbookToJson(workbook);
    expectContains(json, "\"conditionalFormats\":[{\"sqref\":\"A1:A10\",\"rules\":[");
    expectContains(json, "{\"type\":\"colorScale\",\"priority\":1,\"colorScale\":{\"cfvos\":"
                         "[{\"type\":\"min\"},{\"type\":\"max\"}],\"colors\":[\"#F8696B\",\"#4472C4\"]}}");
    expectContains(json, "{\"type\":\"top10\",\"priority\":2,\"stopIfTrue\":true,\"dxfId\":0,"
                         "\"rank\":10,\"percent\":false,\"bottom\":false}");
}

// 测试8: 完整工作簿
TEST_F(JsonWriterTest, WorkbookDump) {
    const std::string sheet = test::worksheetXml(
        "<sheetData><row r=\"1\"><c r=\"A1\"><v>1.5</v></c><c r=\"B1\" t=\"s\"><v>0</v></c></row></sheetData>"
        "<mergeCells count=\"1\"><mergeCell ref=\"C1:D1\"/></mergeCells>");
    auto bytes = test::WorkbookBuilder()
                     .setSharedStrings(test::sharedStringsXml({"say \"hi\""}))
                     .addSheet("Data", sheet)
                     .build();
    auto workbook = reader::XLSXReader::parse(bytes);
    ASSERT_TRUE(workbook) << workbook.error().fullMessage();

    const std::string json = workbookToJson(workbook.value());
    expectContains(json, "{\"date1904\":false,\"theme\":{\"name\":\"Office Theme\"");
    expectContains(json, "\"colors\":[\"#FFFFFF\",\"#000000\",\"#E7E6E6\",\"#44546A\",\"#4472C4\"");
    expectContains(json, "\"sheets\":[{\"name\":\"Data\",\"state\":\"visible\",\"maxRow\":1,\"maxCol\":2");
    expectContains(json, "{\"r\":0,\"c\":0,\"ref\":\"A1\",\"type\":\"number\",\"value\":\"1.5\","
                         "\"number\":1.5,\"display\":\"1.5\"}");
    expectContains(json, "{\"r\":0,\"c\":1,\"ref\":\"B1\",\"type\":\"string\",\"value\":\"say \\\"hi\\\"\"}");
    expectContains(json, "\"merges\":[{\"startRow\":0,\"startCol\":2,\"endRow\":0,\"endCol\":3}]");

    // 缩进输出以换行结束
    const std::string pretty = workbookToJson(workbook.value(), true);
    ASSERT_FALSE(pretty.empty());
    EXPECT_EQ(pretty.back(), '\n');
    expectContains(pretty, "\"name\": \"Data\"");
}

// 测试9: 工作表保护与分组层级
TEST_F(JsonWriterTest, ProtectionAndOutlines) {
    const std::string sheet = test::worksheetXml(
        "<cols><col min=\"1\" max=\"1\" width=\"9\" outlineLevel=\"1\"/></cols>"
        "<sheetData><row r=\"2\" outlineLevel=\"2\" hidden=\"1\"><c r=\"A2\"><v>1</v></c></row></sheetData>"
        "<sheetProtection sheet=\"1\"/>");
    auto bytes = test::WorkbookBuilder()
                     .addSheet("Locked", sheet)
                     .addSheet("Open", test::worksheetXml("<sheetData/>"))
                     .build();
    auto workbook = reader::XLSXReader::parse(bytes);
    ASSERT_TRUE(workbook) << workbook.error().fullMessage();

    const std::string json = workbookToJson(workbook.value());
    expectContains(json, "\"isProtected\":true");
    expectContains(json, "\"isProtected\":false");
    expectContains(json, "\"outlineLevelRow\":[{\"row\":1,\"level\":2,\"hidden\":true}]");
    expectContains(json, "\"outlineLevelCol\":[{\"col\":0,\"level\":1}]");
    expectContains(json, "\"outlineSummaryBelow\":true,\"outlineSummaryRight\":true");
}

}} // namespace sheetlens::cli
