#include "sheetlens/archive/ZipReader.hpp"
#include "sheetlens/archive/ZipWriter.hpp"
#include "sheetlens/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sheetlens {
namespace archive {

class ZipArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/ZipArchive_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
    }

    // 辅助函数：创建测试数据
    std::string createTestString(size_t size = 100) {
        std::string result;
        for (size_t i = 0; i < size; ++i) {
            result += static_cast<char>('A' + (i % 26));
        }
        return result;
    }

    // 辅助函数：创建测试二进制数据
    std::vector<uint8_t> createTestBinaryData(size_t size = 100) {
        std::vector<uint8_t> result(size);
        for (size_t i = 0; i < size; ++i) {
            result[i] = static_cast<uint8_t>(i % 256);
        }
        return result;
    }

    // 辅助函数：写出只含给定条目的归档
    std::vector<uint8_t> buildArchive(const std::vector<std::pair<std::string, std::string>>& entries,
                                      int level = 6) {
        ZipWriter writer(level);
        EXPECT_EQ(writer.open(), ZipError::Ok);
        for (const auto& entry : entries) {
            EXPECT_EQ(writer.addFile(entry.first, entry.second), ZipError::Ok);
        }
        std::vector<uint8_t> bytes;
        EXPECT_EQ(writer.finish(bytes), ZipError::Ok);
        return bytes;
    }
};

// 测试1: 写入后读取字符串条目
TEST_F(ZipArchiveTest, AddAndExtractStringFile) {
    const std::string content = "<?xml version=\"1.0\"?><root/>";
    auto bytes = buildArchive({{"xl/workbook.xml", content}});
    ASSERT_FALSE(bytes.empty());

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    EXPECT_TRUE(reader.isOpen());
    EXPECT_EQ(reader.fileExists("xl/workbook.xml"), ZipError::Ok);

    std::string extracted;
    ASSERT_EQ(reader.extractFile("xl/workbook.xml", extracted), ZipError::Ok);
    EXPECT_EQ(extracted, content);
}

// 测试2: 二进制条目与存储模式
TEST_F(ZipArchiveTest, AddAndExtractBinaryFile) {
    auto data = createTestBinaryData(1000);

    ZipWriter writer(0);
    ASSERT_EQ(writer.open(), ZipError::Ok);
    ASSERT_EQ(writer.addFile("xl/media/image1.png", data.data(), data.size()), ZipError::Ok);
    std::vector<uint8_t> bytes;
    ASSERT_EQ(writer.finish(bytes), ZipError::Ok);
    EXPECT_FALSE(writer.isOpen());

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    ZipReader::EntryInfo info;
    ASSERT_TRUE(reader.getEntryInfo("xl/media/image1.png", info));
    EXPECT_EQ(info.uncompressed_size, 1000u);
    EXPECT_EQ(info.compressed_size, 1000u);
    EXPECT_EQ(info.compression_method, 0);
    EXPECT_FALSE(info.is_directory);

    std::vector<uint8_t> extracted;
    ASSERT_EQ(reader.extractFile("xl/media/image1.png", extracted), ZipError::Ok);
    EXPECT_EQ(extracted, data);
}

// 测试3: 条目按写入顺序列出
TEST_F(ZipArchiveTest, AddMultipleFilesAndList) {
    auto bytes = buildArchive({{"[Content_Types].xml", "a"},
                               {"_rels/.rels", "b"},
                               {"xl/workbook.xml", "c"},
                               {"xl/worksheets/sheet1.xml", "d"}});

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    const auto& files = reader.listFiles();
    ASSERT_EQ(files.size(), 4u);
    EXPECT_EQ(files[0], "[Content_Types].xml");
    EXPECT_EQ(files[1], "_rels/.rels");
    EXPECT_EQ(files[2], "xl/workbook.xml");
    EXPECT_EQ(files[3], "xl/worksheets/sheet1.xml");
}

// 测试4: 大条目压缩
TEST_F(ZipArchiveTest, LargeFileHandling) {
    const std::string large = createTestString(1024 * 1024);
    ZipWriter writer(6);
    ASSERT_EQ(writer.open(), ZipError::Ok);
    ASSERT_EQ(writer.addFile("large.xml", large), ZipError::Ok);
    EXPECT_EQ(writer.getStats().entries_written, 1u);
    EXPECT_EQ(writer.getStats().bytes_written, large.size());
    std::vector<uint8_t> bytes;
    ASSERT_EQ(writer.finish(bytes), ZipError::Ok);

    // 重复内容应当被明显压缩
    EXPECT_LT(bytes.size(), large.size() / 10);

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    std::string extracted;
    ASSERT_EQ(reader.extractFile("large.xml", extracted), ZipError::Ok);
    EXPECT_EQ(extracted, large);
}

// 测试5: 空条目
TEST_F(ZipArchiveTest, EmptyFileHandling) {
    auto bytes = buildArchive({{"empty.txt", ""}});

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    std::string extracted = "stale";
    ASSERT_EQ(reader.extractFile("empty.txt", extracted), ZipError::Ok);
    EXPECT_TRUE(extracted.empty());
}

// 测试6: 不存在的条目与未打开的读取器
TEST_F(ZipArchiveTest, NonExistentFile) {
    auto bytes = buildArchive({{"a.xml", "a"}});

    ZipReader reader;
    std::string content;
    EXPECT_EQ(reader.fileExists("a.xml"), ZipError::NotOpen);
    EXPECT_EQ(reader.extractFile("a.xml", content), ZipError::NotOpen);

    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    EXPECT_EQ(reader.fileExists("missing.xml"), ZipError::FileNotFound);
    EXPECT_EQ(reader.extractFile("missing.xml", content), ZipError::FileNotFound);
    // 条目名区分大小写
    EXPECT_EQ(reader.fileExists("A.xml"), ZipError::FileNotFound);

    ZipReader::EntryInfo info;
    EXPECT_FALSE(reader.getEntryInfo("missing.xml", info));

    reader.close();
    EXPECT_FALSE(reader.isOpen());
    EXPECT_TRUE(reader.listFiles().empty());
}

// 测试7: 同名条目只保留第一次写入
TEST_F(ZipArchiveTest, DuplicateFilename) {
    ZipWriter writer;
    ASSERT_EQ(writer.open(), ZipError::Ok);
    ASSERT_EQ(writer.addFile("dup.xml", std::string_view("first")), ZipError::Ok);
    EXPECT_EQ(writer.addFile("dup.xml", std::string_view("second")), ZipError::Ok);
    EXPECT_EQ(writer.getStats().entries_written, 1u);
    std::vector<uint8_t> bytes;
    ASSERT_EQ(writer.finish(bytes), ZipError::Ok);

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    EXPECT_EQ(reader.listFiles().size(), 1u);
    std::string extracted;
    ASSERT_EQ(reader.extractFile("dup.xml", extracted), ZipError::Ok);
    EXPECT_EQ(extracted, "first");
}

// 测试8: 原样复制条目
TEST_F(ZipArchiveTest, CopyRawFrom) {
    const std::string payload = createTestString(4096);
    auto source = buildArchive({{"keep.xml", payload}, {"drop.xml", "x"}});

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(source.data(), source.size()), ZipError::Ok);
    ZipReader::EntryInfo source_info;
    ASSERT_TRUE(reader.getEntryInfo("keep.xml", source_info));

    ZipWriter writer;
    ASSERT_EQ(writer.open(), ZipError::Ok);
    ASSERT_EQ(writer.copyRawFrom(reader, "keep.xml"), ZipError::Ok);
    EXPECT_EQ(writer.copyRawFrom(reader, "absent.xml"), ZipError::FileNotFound);
    ASSERT_EQ(writer.addFile("new.xml", std::string_view("n")), ZipError::Ok);
    EXPECT_EQ(writer.getStats().entries_copied, 1u);
    EXPECT_EQ(writer.getStats().entries_written, 1u);
    std::vector<uint8_t> bytes;
    ASSERT_EQ(writer.finish(bytes), ZipError::Ok);

    ZipReader copy;
    ASSERT_EQ(copy.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    ASSERT_EQ(copy.listFiles().size(), 2u);
    EXPECT_EQ(copy.listFiles()[0], "keep.xml");

    ZipReader::EntryInfo copied_info;
    ASSERT_TRUE(copy.getEntryInfo("keep.xml", copied_info));
    EXPECT_EQ(copied_info.crc32, source_info.crc32);
    EXPECT_EQ(copied_info.compressed_size, source_info.compressed_size);

    std::string extracted;
    ASSERT_EQ(copy.extractFile("keep.xml", extracted), ZipError::Ok);
    EXPECT_EQ(extracted, payload);
}

// 测试9: 非ZIP数据与未打开的写入器
TEST_F(ZipArchiveTest, InvalidInput) {
    ZipReader reader;
    EXPECT_EQ(reader.openBuffer(nullptr, 0), ZipError::BadFormat);

    const std::string garbage = "this is definitely not a zip archive";
    EXPECT_EQ(reader.openBuffer(reinterpret_cast<const uint8_t*>(garbage.data()), garbage.size()),
              ZipError::BadFormat);
    EXPECT_FALSE(reader.isOpen());

    ZipWriter writer;
    std::vector<uint8_t> bytes;
    EXPECT_EQ(writer.addFile("a.xml", std::string_view("a")), ZipError::NotOpen);
    EXPECT_EQ(writer.finish(bytes), ZipError::NotOpen);
}

// 测试10: 目录结构与特殊字符
TEST_F(ZipArchiveTest, DirectoryStructure) {
    auto bytes = buildArchive({{"xl/worksheets/_rels/sheet1.xml.rels", "r"},
                               {"docProps/表格 说明.xml", "中文内容"}});

    ZipReader reader;
    ASSERT_EQ(reader.openBuffer(bytes.data(), bytes.size()), ZipError::Ok);
    EXPECT_EQ(reader.fileExists("xl/worksheets/_rels/sheet1.xml.rels"), ZipError::Ok);

    std::string extracted;
    ASSERT_EQ(reader.extractFile("docProps/表格 说明.xml", extracted), ZipError::Ok);
    EXPECT_EQ(extracted, "中文内容");
}

}} // namespace sheetlens::archive
