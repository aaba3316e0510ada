/**
 * @file Exception.cpp
 * @brief SheetLens异常类实现
 */

#include "sheetlens/core/Exception.hpp"
#include <fmt/format.h>

namespace sheetlens {
namespace core {

SheetLensException::SheetLensException(const std::string& message,
                                       ErrorCode code,
                                       const char* file,
                                       int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SheetLensException::getDetailedMessage() const {
    std::string detail = fmt::format("[{}] {}", errorCodeName(error_code_), what());
    if (file_ && line_ > 0) {
        detail += fmt::format(" (at {}:{})", file_, line_);
    }
    return detail;
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SheetLensException(filename.empty() ? message : fmt::format("{} (part: {})", message, filename),
                         code, file, line)
    , filename_(filename) {
}

XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           const char* file, int line)
    : SheetLensException(xml_path.empty() ? message : fmt::format("{} (part: {})", message, xml_path),
                         ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path) {
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::XmlParseError:
            throw XMLException(error.message, error.context);
        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
        case ErrorCode::InvalidArchive:
        case ErrorCode::MissingPart:
            throw FileException(error.message, error.context, error.code);
        default:
            throw SheetLensException(error.fullMessage(), error.code);
    }
}

}} // namespace sheetlens::core
