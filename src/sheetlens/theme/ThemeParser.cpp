#include "sheetlens/theme/ThemeParser.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"
#include "sheetlens/xml/XMLStreamReader.hpp"

namespace sheetlens {
namespace theme {

namespace {

std::optional<uint32_t> slotColor(const xml::XMLStreamReader::SimpleElement& slot) {
    for (const auto& child : slot.children) {
        std::string value;
        if (child->localName() == "srgbClr") {
            value = child->getAttribute("val");
        } else if (child->localName() == "sysClr") {
            value = child->getAttribute("lastClr");
        } else {
            continue;
        }
        if (auto color = core::Color::fromHex(value)) {
            return color->getValue();
        }
    }
    return std::nullopt;
}

} // namespace

core::Result<Theme> ThemeParser::parse(std::string_view xml_content, const std::string& part_path) {
    xml::XMLStreamReader reader;
    auto root = reader.parseToDOM(xml_content);
    if (!root) {
        return core::makeError(core::ErrorCode::XmlParseError, reader.getLastErrorMessage(), part_path);
    }
    if (root->localName() != "theme") {
        return core::makeError(core::ErrorCode::XmlParseError, "Missing <a:theme> root element", part_path);
    }

    Theme theme = Theme::defaultOffice();
    if (root->hasAttribute("name")) {
        theme.name = root->getAttribute("name");
    }

    if (auto* scheme = root->findChildByPath("themeElements/clrScheme")) {
        for (const auto& slot : scheme->children) {
            int index = Theme::slotForElement(std::string(slot->localName()));
            if (index < 0) {
                continue;
            }
            if (auto color = slotColor(*slot)) {
                theme.colors[static_cast<size_t>(index)] = *color;
            } else {
                STYLE_WARN("Theme color {} has no usable value, keeping default", slot->localName());
            }
        }
    }

    if (auto* fonts = root->findChildByPath("themeElements/fontScheme")) {
        if (auto* latin = fonts->findChildByPath("majorFont/latin")) {
            std::string face = latin->getAttribute("typeface");
            if (!face.empty()) theme.major_font = face;
        }
        if (auto* latin = fonts->findChildByPath("minorFont/latin")) {
            std::string face = latin->getAttribute("typeface");
            if (!face.empty()) theme.minor_font = face;
        }
    }

    STYLE_DEBUG("Theme '{}' loaded, fonts {}/{}", theme.name, theme.major_font, theme.minor_font);
    return theme;
}

}} // namespace sheetlens::theme
