#pragma once

#include "sheetlens/archive/ZipReader.hpp"
#include "sheetlens/core/Expected.hpp"
#include "sheetlens/opc/Relationships.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sheetlens {
namespace opc {

/**
 * @brief OPC包 - 内存中的 .xlsx 容器
 *
 * 持有原始字节并在其上打开 ZipReader。部件按需整段解压，
 * 关系文件解析后按部件缓存。
 */
class Package {
public:
    /**
     * @brief 打开内存中的包
     * @return 无法识别为 ZIP 时返回 InvalidArchive
     */
    static core::Result<std::unique_ptr<Package>> open(std::vector<uint8_t> bytes);

    Package(const Package&) = delete;
    Package& operator=(const Package&) = delete;

    /**
     * @brief 解压整个部件，不存在时返回 MissingPart
     */
    core::Result<std::string> part(const std::string& path);

    bool hasPart(const std::string& path) const;

    /**
     * @brief 按中央目录顺序列出所有部件
     */
    const std::vector<std::string>& partNames() const { return reader_.listFiles(); }

    /**
     * @brief 部件的关系集合，关系文件不存在时返回空集合
     *
     * 关系文件本身格式错误时返回 XmlParseError。
     */
    core::Result<Relationships> relationshipsOf(const std::string& part_path);

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    archive::ZipReader& zipReader() { return reader_; }

private:
    explicit Package(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::vector<uint8_t> bytes_;
    archive::ZipReader reader_;
    std::unordered_map<std::string, Relationships> rels_cache_;
};

}} // namespace sheetlens::opc
