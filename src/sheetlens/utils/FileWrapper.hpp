/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器与整文件读写
 */

#pragma once

#include "sheetlens/core/Expected.hpp"
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sheetlens {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 析构时自动关闭文件句柄。
 */
class FileWrapper {
public:
    /**
     * @brief 打开文件
     * @param filename 文件名
     * @param mode fopen 模式
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const std::string& filename, const char* mode);

    /**
     * @brief 接管已打开的文件指针
     */
    FileWrapper(FILE* file, std::string filename) : file_(file), filename_(std::move(filename)) {}

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    // 禁用拷贝构造和拷贝赋值
    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept { return file_.get(); }

    explicit operator bool() const noexcept { return file_ != nullptr; }

    /**
     * @brief 从当前位置读到文件末尾
     */
    core::VoidResult readAll(std::vector<uint8_t>& out);

    core::VoidResult writeAll(const void* data, size_t size);

    const std::string& filename() const { return filename_; }

private:
    struct Closer {
        void operator()(FILE* file) const {
            if (file) {
                std::fclose(file);
            }
        }
    };

    std::unique_ptr<FILE, Closer> file_;
    std::string filename_;
};

/**
 * @brief 读取整个文件，打不开时返回 FileNotFound
 */
core::Result<std::vector<uint8_t>> readFileBytes(const std::string& path);

/**
 * @brief 覆盖写入整个文件，失败时返回 FileWriteError
 */
core::VoidResult writeFileBytes(const std::string& path, const void* data, size_t size);

}} // namespace sheetlens::utils
