#pragma once

#include "sheetlens/archive/ZipError.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sheetlens {
namespace archive {

class ZipWriter;

/**
 * @brief 内存ZIP读取器
 *
 * 打开一段完整的内存缓冲区（调用方保证其生命周期长于读取器），
 * 按中央目录顺序缓存条目信息，支持整条目解压和原始数据复制。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        bool is_directory = false;
    };

    ZipReader() = default;
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * @brief 打开内存中的 ZIP 数据
     * @param data 数据起始地址，读取期间必须保持有效
     * @param size 数据长度
     * @return 中央目录无法读取时返回 BadFormat
     */
    ZipError openBuffer(const uint8_t* data, size_t size);

    void close();

    bool isOpen() const { return handle_ != nullptr; }

    /**
     * @brief 按中央目录顺序返回所有条目名
     */
    const std::vector<std::string>& listFiles() const { return order_; }

    ZipError fileExists(std::string_view internal_path) const;

    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    /**
     * @brief 解压整个条目
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data);

private:
    friend class ZipWriter;

    bool buildEntryCache();
    ZipError locateEntry(std::string_view internal_path) const;

    void* handle_ = nullptr;
    std::vector<std::string> order_;
    std::unordered_map<std::string, EntryInfo> entry_cache_;
};

}} // namespace sheetlens::archive
