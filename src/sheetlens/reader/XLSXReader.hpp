#pragma once

#include "sheetlens/core/Expected.hpp"
#include "sheetlens/core/Options.hpp"
#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/format/NumberFormat.hpp"
#include "sheetlens/opc/Package.hpp"
#include "sheetlens/reader/SharedStringsParser.hpp"
#include "sheetlens/reader/WorkbookParser.hpp"
#include "sheetlens/style/StyleResolver.hpp"
#include "sheetlens/style/StyleSheet.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief XLSX文件读取器
 *
 * 按固定顺序驱动各个解析器：
 * 1. 打开包
 * 2. 通过 _rels/.rels 的 officeDocument 关系定位工作簿，缺失时退回 xl/workbook.xml
 * 3. 工作簿关系
 * 4. 主题、样式、共享字符串（按关系类型查找，找不到时使用约定路径）
 * 5. 按工作簿顺序解析工作表
 * 6. 每个工作表的批注、绘图
 *
 * 必需部件（工作簿、样式、工作表）的错误中止整个读取；
 * 可选部件（主题、批注、绘图）出错时记录警告并跳过。
 */
class XLSXReader {
public:
    /**
     * @brief 从内存解析完整工作簿
     */
    static core::Result<core::Workbook> parse(std::vector<uint8_t> bytes,
                                              const core::ReaderOptions& options = core::ReaderOptions());

    /**
     * @brief 读取文件后解析
     */
    static core::Result<core::Workbook> parseFile(const std::string& path,
                                                  const core::ReaderOptions& options = core::ReaderOptions());

private:
    explicit XLSXReader(const core::ReaderOptions& options) : options_(options) {}

    core::Result<core::Workbook> run(std::vector<uint8_t> bytes);

    core::VoidResult locateWorkbook();
    core::VoidResult loadWorkbookPart();
    void loadTheme();
    core::VoidResult loadStyles();
    core::VoidResult loadSharedStrings();
    core::VoidResult loadSheet(const WorkbookParser::SheetEntry& entry, core::Sheet& sheet);
    void loadComments(const opc::Relationships& sheet_rels, core::Sheet& sheet);
    void loadDrawings(const std::vector<std::string>& rel_ids, const opc::Relationships& sheet_rels,
                      core::Sheet& sheet);
    void finalizeCells(core::Sheet& sheet);

    /**
     * @brief 按关系类型查找工作簿的子部件，找不到时检查约定路径
     * @return 两者都不存在时返回空字符串
     */
    std::string findWorkbookPart(std::string_view type_suffix, const std::string& fallback) const;

    core::ReaderOptions options_;
    std::unique_ptr<opc::Package> package_;
    std::string workbook_path_;
    opc::Relationships workbook_rels_;
    std::vector<WorkbookParser::SheetEntry> sheet_entries_;

    core::Workbook workbook_;
    style::StyleSheet stylesheet_;
    SharedStringTable shared_strings_;
    std::unique_ptr<style::StyleResolver> resolver_;
    format::NumberFormatCache format_cache_;
};

}} // namespace sheetlens::reader
