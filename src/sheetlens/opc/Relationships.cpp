#include "sheetlens/opc/Relationships.hpp"

namespace sheetlens {
namespace opc {

namespace {

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const Relationship* Relationships::findById(std::string_view id) const {
    for (const auto& rel : items_) {
        if (rel.id == id) {
            return &rel;
        }
    }
    return nullptr;
}

const Relationship* Relationships::findByType(std::string_view type_suffix) const {
    for (const auto& rel : items_) {
        if (endsWith(rel.type, type_suffix)) {
            return &rel;
        }
    }
    return nullptr;
}

std::vector<const Relationship*> Relationships::findAllByType(std::string_view type_suffix) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : items_) {
        if (endsWith(rel.type, type_suffix)) {
            result.push_back(&rel);
        }
    }
    return result;
}

std::string relationshipsPartFor(std::string_view part_path) {
    if (part_path.empty() || part_path == "/") {
        return "_rels/.rels";
    }
    if (part_path.front() == '/') {
        part_path.remove_prefix(1);
    }
    const size_t slash = part_path.rfind('/');
    if (slash == std::string_view::npos) {
        return "_rels/" + std::string(part_path) + ".rels";
    }
    return std::string(part_path.substr(0, slash + 1)) + "_rels/" +
           std::string(part_path.substr(slash + 1)) + ".rels";
}

std::string resolveTarget(std::string_view source_part, std::string_view target) {
    std::vector<std::string> segments;

    if (!target.empty() && target.front() == '/') {
        target.remove_prefix(1);
    } else {
        // 源部件所在目录
        const size_t slash = source_part.rfind('/');
        if (slash != std::string_view::npos) {
            std::string_view dir = source_part.substr(0, slash);
            if (!dir.empty() && dir.front() == '/') dir.remove_prefix(1);
            size_t pos = 0;
            while (pos <= dir.size() && !dir.empty()) {
                size_t end = dir.find('/', pos);
                if (end == std::string_view::npos) end = dir.size();
                if (end > pos) segments.emplace_back(dir.substr(pos, end - pos));
                pos = end + 1;
            }
        }
    }

    size_t pos = 0;
    while (pos <= target.size() && !target.empty()) {
        size_t end = target.find('/', pos);
        if (end == std::string_view::npos) end = target.size();
        std::string_view segment = target.substr(pos, end - pos);
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (!segment.empty() && segment != ".") {
            segments.emplace_back(segment);
        }
        pos = end + 1;
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    return result;
}

}} // namespace sheetlens::opc
