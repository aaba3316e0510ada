#include "sheetlens/theme/Theme.hpp"

namespace sheetlens {
namespace theme {

int Theme::slotForElement(const std::string& local_name) {
    // clrScheme 中 dk 在前，主题索引中 lt 在前
    if (local_name == "lt1") return 0;
    if (local_name == "dk1") return 1;
    if (local_name == "lt2") return 2;
    if (local_name == "dk2") return 3;
    if (local_name == "hlink") return 10;
    if (local_name == "folHlink") return 11;
    if (local_name.size() == 7 && local_name.compare(0, 6, "accent") == 0) {
        char digit = local_name[6];
        if (digit >= '1' && digit <= '6') {
            return 4 + (digit - '1');
        }
    }
    return -1;
}

}} // namespace sheetlens::theme
