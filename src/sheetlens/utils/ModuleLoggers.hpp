#pragma once
#include "sheetlens/utils/Logger.hpp"
#include "sheetlens/utils/LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    SHEETLENS_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     SHEETLENS_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     SHEETLENS_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    SHEETLENS_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  SHEETLENS_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   SHEETLENS_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   SHEETLENS_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  SHEETLENS_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     SHEETLENS_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      SHEETLENS_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     SHEETLENS_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) SHEETLENS_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  SHEETLENS_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  SHEETLENS_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) SHEETLENS_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// OPC模块 (opc)
#define OPC_DEBUG(...)     SHEETLENS_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_INFO(...)      SHEETLENS_LOG_INFO("[INF][opc ] " __VA_ARGS__)
#define OPC_WARN(...)      SHEETLENS_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)     SHEETLENS_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

// 样式模块 (style / theme)
#define STYLE_DEBUG(...)   SHEETLENS_LOG_DEBUG("[DBG][styl] " __VA_ARGS__)
#define STYLE_WARN(...)    SHEETLENS_LOG_WARN("[WRN][styl] " __VA_ARGS__)

// 数字格式模块 (format)
#define FORMAT_DEBUG(...)  SHEETLENS_LOG_DEBUG("[DBG][nfmt] " __VA_ARGS__)
#define FORMAT_WARN(...)   SHEETLENS_LOG_WARN("[WRN][nfmt] " __VA_ARGS__)

// 条件格式模块 (conditional)
#define CF_DEBUG(...)      SHEETLENS_LOG_DEBUG("[DBG][cf  ] " __VA_ARGS__)
#define CF_WARN(...)       SHEETLENS_LOG_WARN("[WRN][cf  ] " __VA_ARGS__)

// 编辑模块 (editor)
#define EDIT_DEBUG(...)    SHEETLENS_LOG_DEBUG("[DBG][edit] " __VA_ARGS__)
#define EDIT_INFO(...)     SHEETLENS_LOG_INFO("[INF][edit] " __VA_ARGS__)
#define EDIT_WARN(...)     SHEETLENS_LOG_WARN("[WRN][edit] " __VA_ARGS__)
#define EDIT_ERROR(...)    SHEETLENS_LOG_ERROR("[ERR][edit] " __VA_ARGS__)

// 工具模块 (utils / cli)
#define UTILS_DEBUG(...)   SHEETLENS_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    SHEETLENS_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   SHEETLENS_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_DEBUG_LOGS
    #define SHEETLENS_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define SHEETLENS_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_CELL_DEBUG_LOGS
    #define SHEETLENS_LOG_CELL_DEBUG(...) READER_DEBUG(__VA_ARGS__)
#else
    #define SHEETLENS_LOG_CELL_DEBUG(...) do {} while(0)
#endif

#if ENABLE_CF_DEBUG_LOGS
    #define SHEETLENS_LOG_CF_DEBUG(...) CF_DEBUG(__VA_ARGS__)
#else
    #define SHEETLENS_LOG_CF_DEBUG(...) do {} while(0)
#endif
