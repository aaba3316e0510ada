#include "sheetlens/archive/ZipReader.hpp"
#include "sheetlens/archive/ZipWriter.hpp"
#include "sheetlens/opc/Package.hpp"
#include "sheetlens/opc/Relationships.hpp"
#include "sheetlens/opc/ZipRepackWriter.hpp"
#include "sheetlens/utils/Logger.hpp"
#include "TestPackage.hpp"
#include <gtest/gtest.h>

namespace sheetlens {
namespace opc {

class PackageTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/Package_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
    }

    // 辅助函数：直接用 ZipWriter 打包若干条目
    static std::vector<uint8_t> makeArchive(const std::vector<std::pair<std::string, std::string>>& entries) {
        archive::ZipWriter writer;
        EXPECT_EQ(writer.open(), archive::ZipError::Ok);
        for (const auto& entry : entries) {
            EXPECT_EQ(writer.addFile(entry.first, entry.second), archive::ZipError::Ok);
        }
        std::vector<uint8_t> bytes;
        EXPECT_EQ(writer.finish(bytes), archive::ZipError::Ok);
        return bytes;
    }
};

// 测试1: 关系部件路径
TEST_F(PackageTest, RelationshipsPartPath) {
    EXPECT_EQ(relationshipsPartFor("xl/worksheets/sheet1.xml"), "xl/worksheets/_rels/sheet1.xml.rels");
    EXPECT_EQ(relationshipsPartFor("xl/workbook.xml"), "xl/_rels/workbook.xml.rels");
    EXPECT_EQ(relationshipsPartFor(""), "_rels/.rels");
    EXPECT_EQ(relationshipsPartFor("/xl/workbook.xml"), "xl/_rels/workbook.xml.rels");
}

// 测试2: 目标路径解析
TEST_F(PackageTest, ResolveTarget) {
    EXPECT_EQ(resolveTarget("xl/worksheets/sheet1.xml", "../drawings/drawing1.xml"), "xl/drawings/drawing1.xml");
    EXPECT_EQ(resolveTarget("xl/workbook.xml", "worksheets/sheet1.xml"), "xl/worksheets/sheet1.xml");
    EXPECT_EQ(resolveTarget("xl/workbook.xml", "/xl/styles.xml"), "xl/styles.xml");
    EXPECT_EQ(resolveTarget("", "xl/workbook.xml"), "xl/workbook.xml");
    EXPECT_EQ(resolveTarget("xl/workbook.xml", "./theme/../styles.xml"), "xl/styles.xml");
    // 越过根目录的 .. 被忽略
    EXPECT_EQ(resolveTarget("xl/workbook.xml", "../../../docProps/app.xml"), "docProps/app.xml");
}

// 测试3: 按 id 和类型后缀查找关系
TEST_F(PackageTest, RelationshipLookup) {
    Relationship sheet;
    sheet.id = "rId1";
    sheet.type = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
    sheet.target = "worksheets/sheet1.xml";
    sheet.resolved_path = "xl/worksheets/sheet1.xml";

    Relationship styles;
    styles.id = "rId2";
    styles.type = "http://purl.oclc.org/ooxml/officeDocument/relationships/styles";
    styles.target = "styles.xml";
    styles.resolved_path = "xl/styles.xml";

    Relationships rels({sheet, styles});
    EXPECT_EQ(rels.size(), 2u);
    ASSERT_NE(rels.findById("rId2"), nullptr);
    EXPECT_EQ(rels.findById("rId2")->resolved_path, "xl/styles.xml");
    EXPECT_EQ(rels.findById("rId9"), nullptr);

    // Strict 命名空间同样按后缀命中
    ASSERT_NE(rels.findByType(RelType::kStyles), nullptr);
    EXPECT_EQ(rels.findByType(RelType::kStyles)->id, "rId2");
    EXPECT_EQ(rels.findAllByType(RelType::kWorksheet).size(), 1u);
    EXPECT_EQ(rels.findByType(RelType::kTheme), nullptr);
}

// 测试4: 非 ZIP 数据
TEST_F(PackageTest, OpenGarbageFails) {
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', ' ', 'z', 'i', 'p'};
    auto package = Package::open(garbage);
    ASSERT_FALSE(package);
    EXPECT_EQ(package.error().code, core::ErrorCode::InvalidArchive);

    auto empty = Package::open({});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, core::ErrorCode::InvalidArchive);
}

// 测试5: 读取部件与缺失部件
TEST_F(PackageTest, ReadParts) {
    auto bytes = makeArchive({{"a.txt", "alpha"}, {"dir/b.xml", "<b/>"}});
    auto opened = Package::open(bytes);
    ASSERT_TRUE(opened) << opened.error().fullMessage();
    auto& package = *opened.value();

    EXPECT_EQ(package.partNames().size(), 2u);
    EXPECT_TRUE(package.hasPart("dir/b.xml"));
    EXPECT_FALSE(package.hasPart("dir/c.xml"));

    auto content = package.part("a.txt");
    ASSERT_TRUE(content);
    EXPECT_EQ(content.value(), "alpha");

    auto missing = package.part("nope.xml");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, core::ErrorCode::MissingPart);
    EXPECT_EQ(missing.error().context, "nope.xml");

    EXPECT_EQ(package.bytes(), bytes);
}

// 测试6: 包根与工作簿的关系
TEST_F(PackageTest, RelationshipsOfParts) {
    auto bytes = test::WorkbookBuilder()
                     .addSheet("Data", test::worksheetXml("<sheetData/>"))
                     .build();
    auto opened = Package::open(bytes);
    ASSERT_TRUE(opened);
    auto& package = *opened.value();

    auto root = package.relationshipsOf("");
    ASSERT_TRUE(root);
    const Relationship* office = root.value().findByType(RelType::kOfficeDocument);
    ASSERT_NE(office, nullptr);
    EXPECT_EQ(office->resolved_path, "xl/workbook.xml");

    auto workbook = package.relationshipsOf("xl/workbook.xml");
    ASSERT_TRUE(workbook);
    const Relationship* sheet = workbook.value().findById("rId1");
    ASSERT_NE(sheet, nullptr);
    EXPECT_EQ(sheet->resolved_path, "xl/worksheets/sheet1.xml");
    ASSERT_NE(workbook.value().findByType(RelType::kStyles), nullptr);

    // 没有关系文件的部件得到空集合
    auto none = package.relationshipsOf("xl/worksheets/sheet1.xml");
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());

    // 第二次读取走缓存
    auto again = package.relationshipsOf("");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().size(), root.value().size());
}

// 测试7: 格式错误的关系文件
TEST_F(PackageTest, MalformedRelationships) {
    auto bytes = makeArchive({{"xl/workbook.xml", "<workbook/>"},
                              {"xl/_rels/workbook.xml.rels", "<Relationships><Relationship"}});
    auto opened = Package::open(bytes);
    ASSERT_TRUE(opened);

    auto rels = opened.value()->relationshipsOf("xl/workbook.xml");
    ASSERT_FALSE(rels);
    EXPECT_EQ(rels.error().code, core::ErrorCode::XmlParseError);
}

// 测试8: 重新打包，复制原始条目并写入新内容
TEST_F(PackageTest, RepackCopiesAndAdds) {
    auto source_bytes = makeArchive({{"keep.xml", "<keep/>"}, {"replace.xml", "<old/>"}});
    archive::ZipReader source;
    ASSERT_EQ(source.openBuffer(source_bytes.data(), source_bytes.size()), archive::ZipError::Ok);

    ZipRepackWriter writer;
    ASSERT_TRUE(writer.add("replace.xml", "<new/>"));
    ASSERT_TRUE(writer.copyFrom(source, "keep.xml"));
    EXPECT_TRUE(writer.hasEntry("replace.xml"));
    EXPECT_TRUE(writer.hasEntry("keep.xml"));

    // 已写过的路径不会重复写入
    ASSERT_TRUE(writer.copyFrom(source, "replace.xml"));

    auto missing = writer.copyFrom(source, "absent.xml");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, core::ErrorCode::MissingPart);

    EXPECT_EQ(writer.getStats().entries_added, 1u);
    EXPECT_EQ(writer.getStats().entries_copied, 1u);

    auto output = writer.finish();
    ASSERT_TRUE(output) << output.error().fullMessage();

    auto reopened = Package::open(output.value());
    ASSERT_TRUE(reopened);
    auto& package = *reopened.value();
    EXPECT_EQ(package.partNames().size(), 2u);
    EXPECT_EQ(package.part("replace.xml").value(), "<new/>");
    EXPECT_EQ(package.part("keep.xml").value(), "<keep/>");
}

}} // namespace sheetlens::opc
