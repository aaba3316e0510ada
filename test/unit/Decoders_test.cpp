#include "sheetlens/reader/CommentsParser.hpp"
#include "sheetlens/reader/DrawingParser.hpp"
#include "sheetlens/reader/RelationshipsParser.hpp"
#include "sheetlens/reader/SharedStringsParser.hpp"
#include "sheetlens/reader/StylesParser.hpp"
#include "sheetlens/reader/WorkbookParser.hpp"
#include "sheetlens/theme/ThemeParser.hpp"
#include "sheetlens/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace sheetlens {
namespace reader {

class DecodersTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/Decoders_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
    }

    const char* main_ns_ = "xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"";
    const char* rel_ns_ = "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"";
};

// ==================== 关系 ====================

// 测试1: 关系目标相对源部件解析，外部目标不解析
TEST_F(DecodersTest, RelationshipsResolveTargets) {
    const std::string xml =
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/drawing\" "
        "Target=\"../drawings/drawing1.xml\"/>"
        "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink\" "
        "Target=\"https://example.com/a?b=1&amp;c=2\" TargetMode=\"External\"/>"
        "<Relationship Type=\"broken\" Target=\"x.xml\"/>"
        "</Relationships>";

    RelationshipsParser parser("xl/worksheets/sheet1.xml");
    auto result = parser.parse(xml, "xl/worksheets/_rels/sheet1.xml.rels");
    ASSERT_TRUE(result) << result.error().fullMessage();

    const auto& rels = parser.getRelationships();
    ASSERT_EQ(rels.size(), 2u);
    EXPECT_EQ(rels[0].id, "rId1");
    EXPECT_EQ(rels[0].resolved_path, "xl/drawings/drawing1.xml");
    EXPECT_FALSE(rels[0].isExternal());

    EXPECT_TRUE(rels[1].isExternal());
    EXPECT_EQ(rels[1].target, "https://example.com/a?b=1&c=2");
    EXPECT_TRUE(rels[1].resolved_path.empty());
}

// ==================== 工作簿 ====================

// 测试2: 工作表列表、可见性、日期系统和定义名称
TEST_F(DecodersTest, WorkbookSheetsAndNames) {
    const std::string xml = std::string("<workbook ") + main_ns_ + " " + rel_ns_ + ">"
        "<workbookPr date1904=\"true\"/>"
        "<sheets>"
        "<sheet name=\"One\" sheetId=\"1\" r:id=\"rId1\"/>"
        "<sheet name=\"Two\" sheetId=\"7\" state=\"hidden\" r:id=\"rId2\"/>"
        "<sheet name=\"Three\" sheetId=\"3\" state=\"veryHidden\" r:id=\"rId3\"/>"
        "</sheets>"
        "<definedNames>"
        "<definedName name=\"_xlnm.Print_Area\" localSheetId=\"0\">One!$A$1:$B$2</definedName>"
        "<definedName name=\"Secret\" hidden=\"1\">Two!$C$3</definedName>"
        "</definedNames>"
        "</workbook>";

    WorkbookParser parser;
    auto result = parser.parse(xml);
    ASSERT_TRUE(result) << result.error().fullMessage();

    EXPECT_TRUE(parser.isDate1904());
    const auto& sheets = parser.getSheets();
    ASSERT_EQ(sheets.size(), 3u);
    EXPECT_EQ(sheets[0].name, "One");
    EXPECT_EQ(sheets[0].rel_id, "rId1");
    EXPECT_EQ(sheets[0].visibility, core::SheetVisibility::Visible);
    EXPECT_EQ(sheets[1].sheet_id, 7u);
    EXPECT_EQ(sheets[1].visibility, core::SheetVisibility::Hidden);
    EXPECT_EQ(sheets[2].visibility, core::SheetVisibility::VeryHidden);

    const auto& names = parser.getDefinedNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0].name, "_xlnm.Print_Area");
    ASSERT_TRUE(names[0].local_sheet_id.has_value());
    EXPECT_EQ(*names[0].local_sheet_id, 0u);
    EXPECT_EQ(names[0].value, "One!$A$1:$B$2");
    EXPECT_FALSE(names[0].hidden);
    EXPECT_TRUE(names[1].hidden);
    EXPECT_FALSE(names[1].local_sheet_id.has_value());
}

// 测试3: 工作簿部件格式错误
TEST_F(DecodersTest, WorkbookErrors) {
    WorkbookParser parser;

    auto empty = parser.parse("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, core::ErrorCode::XmlParseError);

    auto malformed = parser.parse("<workbook><sheets>");
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code, core::ErrorCode::XmlParseError);
    EXPECT_EQ(malformed.error().context, "xl/workbook.xml");

    auto wrong_root = parser.parse("<notAWorkbook/>");
    ASSERT_FALSE(wrong_root);
    EXPECT_EQ(wrong_root.error().code, core::ErrorCode::XmlParseError);
}

// ==================== 样式 ====================

// 测试4: 样式表各区域原样读取
TEST_F(DecodersTest, StylesRawStructure) {
    const std::string xml = std::string("<styleSheet ") + main_ns_ + ">"
        "<numFmts count=\"1\"><numFmt numFmtId=\"164\" formatCode=\"0.000\"/></numFmts>"
        "<fonts count=\"2\">"
        "<font><sz val=\"11\"/><name val=\"Calibri\"/><scheme val=\"minor\"/></font>"
        "<font><b/><i val=\"0\"/><u/><sz val=\"14\"/><color theme=\"4\" tint=\"0.4\"/><name val=\"Arial\"/></font>"
        "</fonts>"
        "<fills count=\"3\">"
        "<fill><patternFill patternType=\"none\"/></fill>"
        "<fill><patternFill patternType=\"gray125\"/></fill>"
        "<fill><patternFill patternType=\"solid\"><fgColor rgb=\"FFFFFF00\"/><bgColor indexed=\"64\"/></patternFill></fill>"
        "</fills>"
        "<borders count=\"2\">"
        "<border><left/><right/><top/><bottom/><diagonal/></border>"
        "<border diagonalUp=\"1\"><left style=\"thin\"><color rgb=\"FF00FF00\"/></left><bottom style=\"double\"/></border>"
        "</borders>"
        "<cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellStyleXfs>"
        "<cellXfs count=\"2\">"
        "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\"/>"
        "<xf numFmtId=\"164\" fontId=\"1\" fillId=\"2\" borderId=\"1\" xfId=\"0\" applyFont=\"1\" applyFill=\"0\">"
        "<alignment horizontal=\"center\" wrapText=\"1\" textRotation=\"90\"/>"
        "<protection locked=\"0\"/>"
        "</xf>"
        "</cellXfs>"
        "<cellStyles count=\"1\"><cellStyle name=\"Normal\" xfId=\"0\" builtinId=\"0\"/></cellStyles>"
        "<dxfs count=\"1\"><dxf><font><b/><color rgb=\"FF9C0006\"/></font>"
        "<fill><patternFill><bgColor rgb=\"FFFFC7CE\"/></patternFill></fill></dxf></dxfs>"
        "<colors><indexedColors><rgbColor rgb=\"FF000000\"/><rgbColor rgb=\"FF123456\"/></indexedColors></colors>"
        "</styleSheet>";

    StylesParser parser;
    auto result = parser.parse(xml);
    ASSERT_TRUE(result) << result.error().fullMessage();
    const style::StyleSheet& sheet = parser.getStyleSheet();

    ASSERT_EQ(sheet.num_fmts.count(164), 1u);
    EXPECT_EQ(sheet.num_fmts.at(164), "0.000");

    ASSERT_EQ(sheet.fonts.size(), 2u);
    EXPECT_EQ(sheet.fonts[0].scheme, "minor");
    EXPECT_EQ(sheet.fonts[1].bold, true);
    EXPECT_EQ(sheet.fonts[1].italic, false);
    EXPECT_EQ(sheet.fonts[1].underline, core::UnderlineType::Single);
    EXPECT_EQ(sheet.fonts[1].size, 14.0);
    ASSERT_TRUE(sheet.fonts[1].color.has_value());
    EXPECT_EQ(sheet.fonts[1].color->getType(), core::Color::Type::Theme);
    EXPECT_EQ(sheet.fonts[1].color->getValue(), 4u);
    EXPECT_DOUBLE_EQ(sheet.fonts[1].color->getTint(), 0.4);

    ASSERT_EQ(sheet.fills.size(), 3u);
    EXPECT_EQ(sheet.fills[1].pattern, core::PatternType::Gray125);
    EXPECT_EQ(sheet.fills[2].pattern, core::PatternType::Solid);
    ASSERT_TRUE(sheet.fills[2].fg_color.has_value());
    EXPECT_EQ(sheet.fills[2].fg_color->getValue(), 0xFFFF00u);
    ASSERT_TRUE(sheet.fills[2].bg_color.has_value());
    EXPECT_EQ(sheet.fills[2].bg_color->getType(), core::Color::Type::Indexed);

    ASSERT_EQ(sheet.borders.size(), 2u);
    ASSERT_TRUE(sheet.borders[1].left.has_value());
    EXPECT_EQ(sheet.borders[1].left->style, core::BorderStyle::Thin);
    EXPECT_EQ(sheet.borders[1].left->color->getValue(), 0x00FF00u);
    EXPECT_EQ(sheet.borders[1].bottom->style, core::BorderStyle::Double);
    EXPECT_FALSE(sheet.borders[1].top.has_value());
    EXPECT_EQ(sheet.borders[1].diagonal_up, true);

    ASSERT_EQ(sheet.cell_xfs.size(), 2u);
    const style::RawXf& xf = sheet.cell_xfs[1];
    EXPECT_EQ(xf.num_fmt_id, 164u);
    EXPECT_EQ(xf.apply_font, true);
    EXPECT_EQ(xf.apply_fill, false);
    EXPECT_FALSE(xf.apply_border.has_value());
    ASSERT_TRUE(xf.alignment.has_value());
    EXPECT_EQ(xf.alignment->horizontal, core::HorizontalAlign::Center);
    EXPECT_EQ(xf.alignment->wrap_text, true);
    EXPECT_EQ(xf.alignment->text_rotation, 90);
    ASSERT_TRUE(xf.protection.has_value());
    EXPECT_EQ(xf.protection->locked, false);

    ASSERT_EQ(sheet.cell_style_xfs.size(), 1u);
    ASSERT_EQ(sheet.cell_styles.size(), 1u);
    EXPECT_EQ(sheet.cell_styles[0].name, "Normal");

    ASSERT_EQ(sheet.dxfs.size(), 1u);
    ASSERT_TRUE(sheet.dxfs[0].font.has_value());
    EXPECT_EQ(sheet.dxfs[0].font->bold, true);
    ASSERT_TRUE(sheet.dxfs[0].fill.has_value());
    EXPECT_EQ(sheet.dxfs[0].fill->bg_color->getValue(), 0xFFC7CEu);

    ASSERT_EQ(sheet.indexed_colors.size(), 2u);
    EXPECT_EQ(sheet.indexed_colors[1], 0x123456u);
}

// ==================== 共享字符串 ====================

// 测试5: 纯文本、富文本和注音
TEST_F(DecodersTest, SharedStringsRichText) {
    const std::string xml = std::string("<sst ") + main_ns_ + " count=\"3\" uniqueCount=\"3\">"
        "<si><t>Plain</t></si>"
        "<si><r><rPr><b/><sz val=\"12\"/><color theme=\"4\"/><rFont val=\"Arial\"/></rPr><t>Bold</t></r>"
        "<r><rPr><i/></rPr><t xml:space=\"preserve\"> italic</t></r></si>"
        "<si><t>漢字</t><rPh sb=\"0\" eb=\"2\"><t>かんじ</t></rPh></si>"
        "</sst>";

    const core::ThemeColors& theme = core::defaultThemeColors();
    SharedStringsParser parser(theme, nullptr);
    auto result = parser.parse(xml);
    ASSERT_TRUE(result) << result.error().fullMessage();

    const SharedStringTable& table = parser.getTable();
    ASSERT_EQ(table.strings.size(), 3u);
    ASSERT_EQ(table.runs.size(), 3u);

    EXPECT_EQ(table.strings[0], "Plain");
    EXPECT_TRUE(table.runs[0].empty());

    EXPECT_EQ(table.strings[1], "Bold italic");
    ASSERT_EQ(table.runs[1].size(), 2u);
    const core::RichTextRun& bold = table.runs[1][0];
    EXPECT_EQ(bold.text, "Bold");
    EXPECT_EQ(bold.bold, true);
    EXPECT_EQ(bold.size, 12.0);
    EXPECT_EQ(bold.font, "Arial");
    EXPECT_EQ(bold.color, 0x4472C4u);
    EXPECT_EQ(table.runs[1][1].text, " italic");
    EXPECT_EQ(table.runs[1][1].italic, true);
    EXPECT_FALSE(table.runs[1][1].bold.has_value());

    // 注音文本不进入字符串
    EXPECT_EQ(table.strings[2], "漢字");
}

// 测试6: _xHHHH_ 转义
TEST_F(DecodersTest, SharedStringsEscapes) {
    EXPECT_EQ(SharedStringsParser::decodeEscapes("a_x0041_b"), "aAb");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("_x005F_x0041_"), "_x0041_");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("line_x000D_"), "line\r");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("_x00E9_"), "\xC3\xA9");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("_xZZZZ_"), "_xZZZZ_");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("no escapes"), "no escapes");
    // 代理对合成一个四字节码点
    EXPECT_EQ(SharedStringsParser::decodeEscapes("_xD83D__xDE00_"), "\xF0\x9F\x98\x80");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("a_xd83d__xde00_b"), "a\xF0\x9F\x98\x80" "b");
    // 孤立的代理替换为 U+FFFD
    EXPECT_EQ(SharedStringsParser::decodeEscapes("_xD83D_x"), "\xEF\xBF\xBDx");
    EXPECT_EQ(SharedStringsParser::decodeEscapes("_xDE00_"), "\xEF\xBF\xBD");
}

// ==================== 批注 ====================

// 测试7: 作者映射与多段文本拼接
TEST_F(DecodersTest, CommentsAuthorsAndText) {
    const std::string xml = std::string("<comments ") + main_ns_ + ">"
        "<authors><author>Alice</author><author>Bob</author></authors>"
        "<commentList>"
        "<comment ref=\"B2\" authorId=\"1\"><text><r><rPr><b/></rPr><t>Bob:</t></r>"
        "<r><t xml:space=\"preserve\"> check this</t></r></text></comment>"
        "<comment ref=\"C3\" authorId=\"0\"><text><t>plain</t></text></comment>"
        "<comment ref=\"D4\" authorId=\"9\"><text><t>orphan</t></text></comment>"
        "</commentList>"
        "</comments>";

    CommentsParser parser;
    auto result = parser.parse(xml, "xl/comments1.xml");
    ASSERT_TRUE(result) << result.error().fullMessage();

    const auto& comments = parser.getComments();
    ASSERT_EQ(comments.size(), 3u);
    EXPECT_EQ(comments[0].ref, "B2");
    EXPECT_EQ(comments[0].author, "Bob");
    EXPECT_EQ(comments[0].text, "Bob: check this");
    EXPECT_EQ(comments[1].author, "Alice");
    EXPECT_EQ(comments[1].text, "plain");
    // 越界的 authorId 得到空作者
    EXPECT_EQ(comments[2].author, "");
}

// ==================== 绘图 ====================

// 测试8: 双单元格锚点图片与单单元格锚点图表
TEST_F(DecodersTest, DrawingAnchors) {
    opc::Relationship image;
    image.id = "rId1";
    image.type = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
    image.target = "../media/image1.png";
    image.resolved_path = "xl/media/image1.png";
    opc::Relationship chart;
    chart.id = "rId2";
    chart.type = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/chart";
    chart.target = "../charts/chart1.xml";
    chart.resolved_path = "xl/charts/chart1.xml";
    opc::Relationships rels({image, chart});

    const std::string xml =
        "<xdr:wsDr xmlns:xdr=\"http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing\" "
        "xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
        "xmlns:c=\"http://schemas.openxmlformats.org/drawingml/2006/chart\">"
        "<xdr:twoCellAnchor>"
        "<xdr:from><xdr:col>1</xdr:col><xdr:colOff>9525</xdr:colOff><xdr:row>2</xdr:row><xdr:rowOff>0</xdr:rowOff></xdr:from>"
        "<xdr:to><xdr:col>4</xdr:col><xdr:colOff>0</xdr:colOff><xdr:row>10</xdr:row><xdr:rowOff>190500</xdr:rowOff></xdr:to>"
        "<xdr:pic><xdr:nvPicPr><xdr:cNvPr id=\"2\" name=\"Picture 1\" descr=\"Logo\"/><xdr:cNvPicPr/></xdr:nvPicPr>"
        "<xdr:blipFill><a:blip r:embed=\"rId1\"/></xdr:blipFill></xdr:pic>"
        "<xdr:clientData/>"
        "</xdr:twoCellAnchor>"
        "<xdr:oneCellAnchor>"
        "<xdr:from><xdr:col>6</xdr:col><xdr:colOff>0</xdr:colOff><xdr:row>1</xdr:row><xdr:rowOff>0</xdr:rowOff></xdr:from>"
        "<xdr:ext cx=\"4572000\" cy=\"2743200\"/>"
        "<xdr:graphicFrame><xdr:nvGraphicFramePr><xdr:cNvPr id=\"3\" name=\"Chart 1\"/></xdr:nvGraphicFramePr>"
        "<a:graphic><a:graphicData><c:chart r:id=\"rId2\"/></a:graphicData></a:graphic></xdr:graphicFrame>"
        "<xdr:clientData/>"
        "</xdr:oneCellAnchor>"
        "</xdr:wsDr>";

    DrawingParser parser(rels);
    auto result = parser.parse(xml, "xl/drawings/drawing1.xml");
    ASSERT_TRUE(result) << result.error().fullMessage();

    const auto& drawings = parser.getDrawings();
    ASSERT_EQ(drawings.size(), 2u);

    const core::Drawing& picture = drawings[0];
    EXPECT_EQ(picture.kind, core::Drawing::Kind::Picture);
    EXPECT_EQ(picture.anchor_type, "twoCellAnchor");
    EXPECT_EQ(picture.from.col, 1u);
    EXPECT_EQ(picture.from.col_offset, 9525);
    EXPECT_EQ(picture.from.row, 2u);
    ASSERT_TRUE(picture.to.has_value());
    EXPECT_EQ(picture.to->col, 4u);
    EXPECT_EQ(picture.to->row, 10u);
    EXPECT_EQ(picture.to->row_offset, 190500);
    EXPECT_EQ(picture.name, "Picture 1");
    EXPECT_EQ(picture.description, "Logo");
    EXPECT_EQ(picture.target, "xl/media/image1.png");

    const core::Drawing& graph = drawings[1];
    EXPECT_EQ(graph.kind, core::Drawing::Kind::Chart);
    EXPECT_EQ(graph.anchor_type, "oneCellAnchor");
    EXPECT_EQ(graph.from.col, 6u);
    EXPECT_FALSE(graph.to.has_value());
    EXPECT_EQ(graph.ext_cx, 4572000);
    EXPECT_EQ(graph.ext_cy, 2743200);
    EXPECT_EQ(graph.name, "Chart 1");
    EXPECT_EQ(graph.target, "xl/charts/chart1.xml");
}

// ==================== 主题 ====================

// 测试9: 主题配色与字体
TEST_F(DecodersTest, ThemeColorsAndFonts) {
    const std::string xml =
        "<a:theme xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" name=\"Custom\">"
        "<a:themeElements>"
        "<a:clrScheme name=\"Custom\">"
        "<a:dk1><a:sysClr val=\"windowText\" lastClr=\"111111\"/></a:dk1>"
        "<a:lt1><a:sysClr val=\"window\" lastClr=\"FEFEFE\"/></a:lt1>"
        "<a:dk2><a:srgbClr val=\"222222\"/></a:dk2>"
        "<a:accent1><a:srgbClr val=\"FF0000\"/></a:accent1>"
        "<a:accent6><a:srgbClr val=\"00FF00\"/></a:accent6>"
        "</a:clrScheme>"
        "<a:fontScheme name=\"Custom\">"
        "<a:majorFont><a:latin typeface=\"Georgia\"/></a:majorFont>"
        "<a:minorFont><a:latin typeface=\"Verdana\"/></a:minorFont>"
        "</a:fontScheme>"
        "</a:themeElements>"
        "</a:theme>";

    auto result = theme::ThemeParser::parse(xml);
    ASSERT_TRUE(result) << result.error().fullMessage();
    const theme::Theme& parsed = result.value();

    EXPECT_EQ(parsed.name, "Custom");
    EXPECT_EQ(parsed.colors[0], 0xFEFEFEu);   // lt1
    EXPECT_EQ(parsed.colors[1], 0x111111u);   // dk1
    EXPECT_EQ(parsed.colors[3], 0x222222u);   // dk2
    EXPECT_EQ(parsed.colors[4], 0xFF0000u);   // accent1
    EXPECT_EQ(parsed.colors[9], 0x00FF00u);   // accent6
    // 未给出的槽位保留默认值
    EXPECT_EQ(parsed.colors[2], 0xE7E6E6u);
    EXPECT_EQ(parsed.colors[10], 0x0563C1u);

    EXPECT_EQ(parsed.major_font, "Georgia");
    EXPECT_EQ(parsed.minor_font, "Verdana");
}

// 测试10: 主题根元素错误
TEST_F(DecodersTest, ThemeWrongRoot) {
    auto wrong = theme::ThemeParser::parse("<styleSheet/>");
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, core::ErrorCode::XmlParseError);

    auto broken = theme::ThemeParser::parse("<a:theme");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, core::ErrorCode::XmlParseError);
}

}} // namespace sheetlens::reader
