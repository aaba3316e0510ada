#include "sheetlens/utils/Logger.hpp"
#include "sheetlens/xml/XMLStreamReader.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace sheetlens {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/XMLStreamReader_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
        reader_ = std::make_unique<XMLStreamReader>();
    }

    void TearDown() override {
        reader_.reset();
    }

    std::unique_ptr<XMLStreamReader> reader_;

    const std::string simple_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<root>
    <element attr="value">Text content</element>
    <empty_element/>
    <parent>
        <child>Child text</child>
        <child>Another child</child>
    </parent>
</root>)";

    const std::string workbook_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
    <sheets>
        <sheet name="Sheet1" sheetId="1" r:id="rId1"/>
        <sheet name="Sheet2" sheetId="2" r:id="rId2"/>
    </sheets>
    <definedNames>
        <definedName name="Print_Area" localSheetId="0">'Sheet1'!$A$1:$C$10</definedName>
    </definedNames>
</workbook>)";
};

// 测试1: 基本解析功能
TEST_F(XMLStreamReaderTest, BasicParsing) {
    std::vector<std::pair<std::string, int>> elements;
    std::vector<std::string> ends;
    std::vector<std::pair<std::string, int>> texts;

    reader_->setStartElementCallback([&](std::string_view name, const XMLAttributes&, int depth) {
        elements.emplace_back(std::string(name), depth);
    });
    reader_->setEndElementCallback([&](std::string_view name, int) {
        ends.emplace_back(name);
    });
    reader_->setTextCallback([&](std::string_view text, int depth) {
        texts.emplace_back(std::string(text), depth);
    });
    reader_->setTrimWhitespace(true);

    ASSERT_EQ(reader_->parseFromString(simple_xml_), XMLParseError::Ok);
    EXPECT_EQ(reader_->getElementsParsed(), 6u);

    ASSERT_EQ(elements.size(), 6u);
    EXPECT_EQ(elements[0], std::make_pair(std::string("root"), 0));
    EXPECT_EQ(elements[1], std::make_pair(std::string("element"), 1));
    EXPECT_EQ(elements[4], std::make_pair(std::string("child"), 2));

    // 结束事件按文档顺序，根元素最后
    ASSERT_EQ(ends.size(), 6u);
    EXPECT_EQ(ends.front(), "element");
    EXPECT_EQ(ends.back(), "root");

    // 纯空白文本在裁剪后不回调
    ASSERT_EQ(texts.size(), 3u);
    EXPECT_EQ(texts[0], std::make_pair(std::string("Text content"), 1));
    EXPECT_EQ(texts[1], std::make_pair(std::string("Child text"), 2));
    EXPECT_EQ(texts[2], std::make_pair(std::string("Another child"), 2));
}

// 测试2: 属性解析
TEST_F(XMLStreamReaderTest, AttributeParsing) {
    std::vector<std::string> names;
    std::vector<std::string> ids;

    reader_->setStartElementCallback([&](std::string_view name, const XMLAttributes& attributes, int) {
        if (name != "sheet") {
            return;
        }
        auto sheet_name = findAttribute(attributes, "name");
        auto rel_id = findAttribute(attributes, "r:id");
        ASSERT_TRUE(sheet_name);
        ASSERT_TRUE(rel_id);
        names.emplace_back(*sheet_name);
        ids.emplace_back(*rel_id);
        // 前缀必须完全一致
        EXPECT_FALSE(findAttribute(attributes, "id"));
    });

    ASSERT_EQ(reader_->parseFromString(workbook_xml_), XMLParseError::Ok);
    EXPECT_EQ(names, (std::vector<std::string>{"Sheet1", "Sheet2"}));
    EXPECT_EQ(ids, (std::vector<std::string>{"rId1", "rId2"}));
}

// 测试3: 实体解码与空白保留
TEST_F(XMLStreamReaderTest, EntitiesAndWhitespace) {
    std::vector<std::string> texts;
    std::string attr_value;

    reader_->setStartElementCallback([&](std::string_view name, const XMLAttributes& attributes, int) {
        if (name == "t") {
            attr_value = std::string(findAttribute(attributes, "note").value_or(""));
        }
    });
    reader_->setTextCallback([&](std::string_view text, int) {
        texts.emplace_back(text);
    });

    const std::string xml = "<si><t note=\"a&amp;b &quot;c&quot;\" xml:space=\"preserve\">  x &lt; y &#x4E2D;  </t></si>";
    ASSERT_EQ(reader_->parseFromString(xml), XMLParseError::Ok);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], "  x < y \xE4\xB8\xAD  ");
    EXPECT_EQ(attr_value, "a&b \"c\"");
}

// 测试4: 简单DOM
TEST_F(XMLStreamReaderTest, DOMParsing) {
    auto root = reader_->parseToDOM(workbook_xml_);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, "workbook");
    EXPECT_EQ(root->getAttribute("xmlns"), "http://schemas.openxmlformats.org/spreadsheetml/2006/main");

    auto sheets = root->findChild("sheets");
    ASSERT_NE(sheets, nullptr);
    auto sheet_list = sheets->findChildren("sheet");
    ASSERT_EQ(sheet_list.size(), 2u);
    EXPECT_EQ(sheet_list[1]->getAttribute("name"), "Sheet2");
    EXPECT_TRUE(sheet_list[0]->hasAttribute("r:id"));
    EXPECT_EQ(sheet_list[0]->getAttribute("missing", "default"), "default");
    EXPECT_EQ(sheet_list[0]->parent, sheets);

    auto defined = root->findChildByPath("definedNames/definedName");
    ASSERT_NE(defined, nullptr);
    EXPECT_EQ(defined->text, "'Sheet1'!$A$1:$C$10");
    EXPECT_EQ(root->findChildByPath("definedNames/missing"), nullptr);
}

// 测试5: 命名空间前缀
TEST_F(XMLStreamReaderTest, NamespaceHandling) {
    EXPECT_EQ(localName("x14:cfRule"), "cfRule");
    EXPECT_EQ(localName("cfRule"), "cfRule");

    const std::string xml = R"(<a:theme xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main">
  <a:themeElements><a:clrScheme name="Office"><a:dk1><a:sysClr val="windowText" lastClr="000000"/></a:dk1></a:clrScheme></a:themeElements>
</a:theme>)";
    auto root = reader_->parseToDOM(xml);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, "a:theme");
    EXPECT_EQ(root->localName(), "theme");

    auto sys_clr = root->findChildByPath("themeElements/clrScheme/dk1/sysClr");
    ASSERT_NE(sys_clr, nullptr);
    EXPECT_EQ(sys_clr->getAttribute("lastClr"), "000000");
}

// 测试6: 错误处理
TEST_F(XMLStreamReaderTest, ErrorHandling) {
    EXPECT_EQ(reader_->parseFromString(""), XMLParseError::InvalidInput);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::InvalidInput);

    EXPECT_EQ(reader_->parseFromString("<root><unclosed></root>"), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader_->getLastErrorMessage().empty());
    EXPECT_EQ(reader_->getErrorLine(), 1);

    EXPECT_EQ(reader_->parseToDOM("<root attr=\"x></root>"), nullptr);

    // 失败后可以继续解析新文档
    EXPECT_EQ(reader_->parseFromString("<ok/>"), XMLParseError::Ok);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::Ok);
}

// 测试7: 回调异常中止解析
TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int seen = 0;
    reader_->setStartElementCallback([&](std::string_view name, const XMLAttributes&, int) {
        ++seen;
        if (name == "empty_element") {
            throw std::runtime_error("boom");
        }
    });

    EXPECT_EQ(reader_->parseFromString(simple_xml_), XMLParseError::CallbackError);
    EXPECT_EQ(seen, 3);
    EXPECT_NE(reader_->getLastErrorMessage().find("boom"), std::string::npos);
}

// 测试8: 解析器版本
TEST_F(XMLStreamReaderTest, ParserVersion) {
    EXPECT_EQ(reader_->getParserVersion().rfind("expat_", 0), 0u);
}

// 测试9: 元素原文的字节位置
TEST_F(XMLStreamReaderTest, ByteOffsets) {
    const std::string xml = "<c r=\"A1\"><is><t>x</t></is><is/></c>";
    std::vector<std::string> slices;
    size_t begin = 0;
    size_t open_end = 0;

    reader_->setStartElementCallback([&](std::string_view name, const XMLAttributes&, int) {
        if (name == "is") {
            begin = static_cast<size_t>(reader_->getCurrentByteIndex());
            open_end = begin + static_cast<size_t>(reader_->getCurrentByteCount());
        }
    });
    reader_->setEndElementCallback([&](std::string_view name, int) {
        if (name == "is") {
            const size_t end = static_cast<size_t>(reader_->getCurrentByteIndex()) +
                               static_cast<size_t>(reader_->getCurrentByteCount());
            slices.push_back(xml.substr(begin, std::max(end, open_end) - begin));
        }
    });

    ASSERT_EQ(reader_->parseFromString(xml), XMLParseError::Ok);
    EXPECT_EQ(slices, (std::vector<std::string>{"<is><t>x</t></is>", "<is/>"}));

    // 解析结束后没有当前事件
    EXPECT_EQ(reader_->getCurrentByteIndex(), -1);
}

}} // namespace sheetlens::xml
