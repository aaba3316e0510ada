#include "sheetlens/core/ErrorCode.hpp"

namespace sheetlens {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                return "Success";
        case ErrorCode::InvalidArgument:   return "Invalid argument";
        case ErrorCode::InternalError:     return "Internal error";
        case ErrorCode::FileNotFound:      return "File not found";
        case ErrorCode::FileWriteError:    return "File write error";
        case ErrorCode::FileReadError:     return "File read error";
        case ErrorCode::InvalidArchive:    return "Invalid archive";
        case ErrorCode::MissingPart:       return "Missing package part";
        case ErrorCode::InvalidReference:  return "Invalid cell reference";
        case ErrorCode::ZipWriteError:     return "ZIP write error";
        case ErrorCode::XmlParseError:     return "XML parse error";
        case ErrorCode::InvalidSheetIndex: return "Invalid sheet index";
        case ErrorCode::NotLoaded:         return "No workbook loaded";
        default:                           return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                return "Ok";
        case ErrorCode::InvalidArgument:   return "InvalidArgument";
        case ErrorCode::InternalError:     return "InternalError";
        case ErrorCode::FileNotFound:      return "FileNotFound";
        case ErrorCode::FileWriteError:    return "FileWriteError";
        case ErrorCode::FileReadError:     return "FileReadError";
        case ErrorCode::InvalidArchive:    return "InvalidArchive";
        case ErrorCode::MissingPart:       return "MissingPart";
        case ErrorCode::InvalidReference:  return "InvalidReference";
        case ErrorCode::ZipWriteError:     return "ZipWriteError";
        case ErrorCode::XmlParseError:     return "XmlParseError";
        case ErrorCode::InvalidSheetIndex: return "InvalidSheetIndex";
        case ErrorCode::NotLoaded:         return "NotLoaded";
        default:                           return "Unknown";
    }
}

}} // namespace sheetlens::core
