#pragma once

// 日志开关，设置为 0 禁用对应的高频调试日志

#define ENABLE_ZIP_DEBUG_LOGS 0       // 每个 ZIP 条目的读写
#define ENABLE_CELL_DEBUG_LOGS 0      // 每个单元格的解析
#define ENABLE_CF_DEBUG_LOGS 0        // 每条条件格式规则的求值
