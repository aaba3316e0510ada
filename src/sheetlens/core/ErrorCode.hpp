#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace sheetlens {
namespace core {

/**
 * @brief SheetLens统一错误码
 *
 * 底层模块通过 Expected 返回错误码，只有面向用户的入口才转成异常。
 * 编号按类别分段，便于日志中快速定位来源。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileWriteError = 23,
    FileReadError = 24,

    // 包结构与引用错误 (40-59)
    InvalidArchive = 40,
    MissingPart = 41,
    InvalidReference = 42,

    // ZIP/XML处理错误 (60-79)
    ZipWriteError = 60,
    XmlParseError = 61,

    // 编辑器错误 (80-99)
    InvalidSheetIndex = 80,
    NotLoaded = 81
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文，通常是部件路径

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (context: {})", message, context);
    }
};

/**
 * @brief 错误码的可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码的枚举名，例如 "MissingPart"
 */
const char* errorCodeName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 把错误转换为对应的异常并抛出，定义在 Exception.cpp
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace sheetlens::core
