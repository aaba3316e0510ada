#pragma once

namespace sheetlens {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // 归档未打开
    IoFail,               // 读写失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 条目过大
    FileNotFound,         // 条目不存在
    InvalidParameter,     // 无效参数
    CompressionFail,      // 压缩失败
    InternalError         // 内部错误
};

// 只有 ZipError::Ok 视为成功
constexpr bool operator!(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "Ok";
        case ZipError::NotOpen:          return "NotOpen";
        case ZipError::IoFail:           return "IoFail";
        case ZipError::BadFormat:        return "BadFormat";
        case ZipError::TooLarge:         return "TooLarge";
        case ZipError::FileNotFound:     return "FileNotFound";
        case ZipError::InvalidParameter: return "InvalidParameter";
        case ZipError::CompressionFail:  return "CompressionFail";
        default:                         return "InternalError";
    }
}

}} // namespace sheetlens::archive
