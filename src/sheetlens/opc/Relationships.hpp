#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sheetlens {
namespace opc {

/**
 * @brief 常用关系类型的后缀，按后缀匹配以同时兼容 Transitional 与 Strict 命名空间
 */
namespace RelType {
    inline constexpr std::string_view kOfficeDocument = "/officeDocument";
    inline constexpr std::string_view kWorksheet = "/worksheet";
    inline constexpr std::string_view kStyles = "/styles";
    inline constexpr std::string_view kSharedStrings = "/sharedStrings";
    inline constexpr std::string_view kTheme = "/theme";
    inline constexpr std::string_view kComments = "/comments";
    inline constexpr std::string_view kDrawing = "/drawing";
    inline constexpr std::string_view kHyperlink = "/hyperlink";
    inline constexpr std::string_view kImage = "/image";
    inline constexpr std::string_view kChart = "/chart";
}

/**
 * @brief 单条关系
 */
struct Relationship {
    std::string id;             // 如 "rId1"
    std::string type;           // 完整类型 URI
    std::string target;         // 原始 Target
    std::string target_mode = "Internal";
    std::string resolved_path;  // 包内绝对路径（不带前导 '/'），外部目标为空

    bool isExternal() const { return target_mode == "External"; }
};

/**
 * @brief 某个部件的关系集合
 */
class Relationships {
public:
    Relationships() = default;
    explicit Relationships(std::vector<Relationship> items) : items_(std::move(items)) {}

    const std::vector<Relationship>& items() const { return items_; }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }

    const Relationship* findById(std::string_view id) const;

    /**
     * @brief 第一个类型以 type_suffix 结尾的关系
     */
    const Relationship* findByType(std::string_view type_suffix) const;

    std::vector<const Relationship*> findAllByType(std::string_view type_suffix) const;

private:
    std::vector<Relationship> items_;
};

/**
 * @brief 部件路径 "xl/worksheets/sheet1.xml" 对应的关系部件 "xl/worksheets/_rels/sheet1.xml.rels"
 *
 * 空路径表示包根，对应 "_rels/.rels"。
 */
std::string relationshipsPartFor(std::string_view part_path);

/**
 * @brief 以源部件所在目录为基准解析 Target
 *
 * 以 '/' 开头的目标相对于包根；"." 与 ".." 段被规范化，越过根的 ".." 被忽略。
 */
std::string resolveTarget(std::string_view source_part, std::string_view target);

}} // namespace sheetlens::opc
