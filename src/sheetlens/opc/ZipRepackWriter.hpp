#pragma once

#include "sheetlens/archive/ZipWriter.hpp"
#include "sheetlens/core/Expected.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sheetlens {

namespace archive {
    class ZipReader;
}

namespace opc {

/**
 * @brief ZIP重新打包写入器
 *
 * 核心功能：
 * 1. 从源归档原样复制条目（压缩数据不解压不重压）
 * 2. 写入重新生成的部件
 * 3. 每个路径只写一次，写入顺序即调用顺序
 */
class ZipRepackWriter {
public:
    struct Stats {
        size_t entries_added = 0;
        size_t entries_copied = 0;
    };

    explicit ZipRepackWriter(int compression_level = 6);

    ZipRepackWriter(const ZipRepackWriter&) = delete;
    ZipRepackWriter& operator=(const ZipRepackWriter&) = delete;

    /**
     * 添加新内容
     */
    core::VoidResult add(const std::string& path, const std::string& content);

    /**
     * 从源归档复制条目
     */
    core::VoidResult copyFrom(archive::ZipReader& source, const std::string& entry_path);

    bool hasEntry(const std::string& path) const;

    /**
     * 写出中央目录并返回完整归档
     */
    core::Result<std::vector<uint8_t>> finish();

    Stats getStats() const { return stats_; }

private:
    core::VoidResult ensureOpen();

    archive::ZipWriter zip_;
    std::vector<std::string> written_;
    Stats stats_;
};

}} // namespace sheetlens::opc
