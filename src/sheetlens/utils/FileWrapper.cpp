#include "sheetlens/utils/FileWrapper.hpp"
#include "sheetlens/core/Exception.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <cstring>

namespace sheetlens {
namespace utils {

FileWrapper::FileWrapper(const std::string& filename, const char* mode)
    : file_(std::fopen(filename.c_str(), mode)), filename_(filename) {
    if (!file_) {
        const bool writing = std::strchr(mode, 'w') != nullptr || std::strchr(mode, 'a') != nullptr;
        throw core::FileException(
            "Failed to open file: " + filename,
            filename,
            writing ? core::ErrorCode::FileWriteError : core::ErrorCode::FileNotFound,
            __FILE__, __LINE__
        );
    }
}

core::VoidResult FileWrapper::readAll(std::vector<uint8_t>& out) {
    char buffer[64 * 1024];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file_.get())) > 0) {
        out.insert(out.end(), buffer, buffer + n);
    }
    if (std::ferror(file_.get())) {
        return core::makeError(core::ErrorCode::FileReadError, "Failed to read file", filename_);
    }
    return {};
}

core::VoidResult FileWrapper::writeAll(const void* data, size_t size) {
    if (size > 0 && std::fwrite(data, 1, size, file_.get()) != size) {
        return core::makeError(core::ErrorCode::FileWriteError, "Failed to write file", filename_);
    }
    if (std::fflush(file_.get()) != 0) {
        return core::makeError(core::ErrorCode::FileWriteError, "Failed to flush file", filename_);
    }
    return {};
}

core::Result<std::vector<uint8_t>> readFileBytes(const std::string& path) {
    FILE* raw = std::fopen(path.c_str(), "rb");
    if (!raw) {
        UTILS_ERROR("Cannot open {}", path);
        return core::makeError(core::ErrorCode::FileNotFound, "Cannot open file", path);
    }

    FileWrapper file(raw, path);
    std::vector<uint8_t> bytes;
    auto result = file.readAll(bytes);
    if (!result) {
        return result.error();
    }
    UTILS_DEBUG("Read {} bytes from {}", bytes.size(), path);
    return bytes;
}

core::VoidResult writeFileBytes(const std::string& path, const void* data, size_t size) {
    FILE* raw = std::fopen(path.c_str(), "wb");
    if (!raw) {
        UTILS_ERROR("Cannot create {}", path);
        return core::makeError(core::ErrorCode::FileWriteError, "Cannot create file", path);
    }

    FileWrapper file(raw, path);
    return file.writeAll(data, size);
}

}} // namespace sheetlens::utils
