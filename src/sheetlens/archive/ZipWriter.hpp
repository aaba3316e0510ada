#pragma once

#include "sheetlens/archive/ZipError.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sheetlens {
namespace archive {

class ZipReader;

/**
 * @brief 内存ZIP写入器
 *
 * 条目写入一个可增长的内存流，finish() 写出中央目录并交出字节。
 * 同名条目只保留第一次写入。
 */
class ZipWriter {
public:
    struct Stats {
        size_t entries_written = 0;
        size_t entries_copied = 0;
        size_t bytes_written = 0;
    };

    /**
     * @param compression_level 0 表示仅存储，1-9 为 deflate 级别
     */
    explicit ZipWriter(int compression_level = 6);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ZipError open();
    bool isOpen() const { return handle_ != nullptr; }

    ZipError addFile(std::string_view internal_path, const void* data, size_t size);
    ZipError addFile(std::string_view internal_path, std::string_view content) {
        return addFile(internal_path, content.data(), content.size());
    }

    /**
     * @brief 从另一个归档原样复制条目（不解压、不重新压缩）
     */
    ZipError copyRawFrom(ZipReader& reader, std::string_view internal_path);

    /**
     * @brief 写出中央目录并取出完整归档
     */
    ZipError finish(std::vector<uint8_t>& output);

    const Stats& getStats() const { return stats_; }

private:
    void cleanup();
    bool markWritten(std::string_view internal_path);

    void* handle_ = nullptr;
    void* mem_stream_ = nullptr;
    int compression_level_;
    std::unordered_set<std::string> written_paths_;
    Stats stats_;
};

}} // namespace sheetlens::archive
