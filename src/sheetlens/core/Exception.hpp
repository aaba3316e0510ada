/**
 * @file Exception.hpp
 * @brief SheetLens异常类定义
 */

#pragma once

#include <stdexcept>
#include <string>
#include "sheetlens/core/ErrorCode.hpp"

namespace sheetlens {
namespace core {

/**
 * @brief SheetLens基础异常类
 *
 * 仅在 Expected::valueOrThrow() 和偏好异常的前端（命令行工具）中出现。
 */
class SheetLensException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的源文件
     * @param line 发生错误的行号
     */
    SheetLensException(const std::string& message,
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr,
                       int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief "[MissingPart] message (at file:line)" 形式的详细信息
     */
    std::string getDetailedMessage() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 文件与包结构相关异常
 */
class FileException : public SheetLensException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public SheetLensException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

}} // namespace sheetlens::core

#define SHEETLENS_THROW(message, code) \
    throw ::sheetlens::core::SheetLensException(message, code, __FILE__, __LINE__)
