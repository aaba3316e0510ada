#include "sheetlens/archive/ZipReader.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>

namespace sheetlens {
namespace archive {

ZipReader::~ZipReader() {
    close();
}

ZipError ZipReader::openBuffer(const uint8_t* data, size_t size) {
    close();

    if (!data || size == 0) {
        ARCHIVE_ERROR("Cannot open empty buffer as zip archive");
        return ZipError::BadFormat;
    }
    if (size > static_cast<size_t>(INT32_MAX)) {
        ARCHIVE_ERROR("Zip buffer too large: {} bytes", size);
        return ZipError::TooLarge;
    }

    handle_ = mz_zip_reader_create();
    if (!handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    // copy=0：直接引用调用方的缓冲区
    int32_t result = mz_zip_reader_open_buffer(handle_, const_cast<uint8_t*>(data),
                                               static_cast<int32_t>(size), 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip buffer ({} bytes), error: {}", size, result);
        mz_zip_reader_delete(&handle_);
        handle_ = nullptr;
        return ZipError::BadFormat;
    }

    if (!buildEntryCache()) {
        close();
        return ZipError::BadFormat;
    }

    ARCHIVE_DEBUG("Zip buffer opened, {} entries", order_.size());
    return ZipError::Ok;
}

void ZipReader::close() {
    if (handle_) {
        mz_zip_reader_close(handle_);
        mz_zip_reader_delete(&handle_);
        handle_ = nullptr;
    }
    order_.clear();
    entry_cache_.clear();
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    if (!handle_) {
        return ZipError::NotOpen;
    }
    return entry_cache_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    auto it = entry_cache_.find(std::string(internal_path));
    if (it == entry_cache_.end()) {
        return false;
    }
    info = it->second;
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }
    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) {
    ZipError located = locateEntry(internal_path);
    if (located != ZipError::Ok) {
        return located;
    }

    mz_zip_file* info = nullptr;
    if (mz_zip_reader_entry_get_info(handle_, &info) != MZ_OK || !info) {
        return ZipError::BadFormat;
    }
    if (info->uncompressed_size > static_cast<int64_t>(INT32_MAX)) {
        ARCHIVE_ERROR("Entry {} too large: {} bytes", internal_path, info->uncompressed_size);
        return ZipError::TooLarge;
    }

    if (mz_zip_reader_entry_open(handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    const int32_t expected = static_cast<int32_t>(info->uncompressed_size);
    std::vector<uint8_t> buffer(static_cast<size_t>(expected));
    int32_t total = 0;
    while (total < expected) {
        int32_t read = mz_zip_reader_entry_read(handle_, buffer.data() + total, expected - total);
        if (read <= 0) {
            break;
        }
        total += read;
    }
    int32_t close_result = mz_zip_reader_entry_close(handle_);

    if (total != expected || close_result != MZ_OK) {
        ARCHIVE_ERROR("Incomplete read for {}, expected {} bytes, read {} (close: {})",
                      internal_path, expected, total, close_result);
        return ZipError::BadFormat;
    }

    data.swap(buffer);
    SHEETLENS_LOG_ZIP_DEBUG("Extracted {} ({} bytes)", internal_path, data.size());
    return ZipError::Ok;
}

bool ZipReader::buildEntryCache() {
    order_.clear();
    entry_cache_.clear();

    int32_t result = mz_zip_reader_goto_first_entry(handle_);
    if (result == MZ_END_OF_LIST) {
        return true;  // 空归档
    }
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Cannot read zip central directory, error: {}", result);
        return false;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(handle_, &file_info) != MZ_OK || !file_info) {
            ARCHIVE_ERROR("Corrupted zip central directory entry");
            return false;
        }
        if (!file_info->filename || file_info->filename[0] == '\0') {
            continue;
        }

        EntryInfo info;
        info.path = file_info->filename;
        info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
        info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
        info.crc32 = file_info->crc;
        info.compression_method = file_info->compression_method;
        info.is_directory = info.path.back() == '/';

        if (entry_cache_.count(info.path)) {
            ARCHIVE_WARN("Duplicate zip entry {}, keeping the first one", info.path);
            continue;
        }
        order_.push_back(info.path);
        entry_cache_.emplace(info.path, std::move(info));
    } while ((result = mz_zip_reader_goto_next_entry(handle_)) == MZ_OK);

    if (result != MZ_END_OF_LIST) {
        ARCHIVE_ERROR("Zip central directory iteration failed, error: {}", result);
        return false;
    }
    return true;
}

ZipError ZipReader::locateEntry(std::string_view internal_path) const {
    if (!handle_) {
        return ZipError::NotOpen;
    }
    std::string path(internal_path);
    if (!entry_cache_.count(path)) {
        return ZipError::FileNotFound;
    }
    // 区分大小写匹配
    if (mz_zip_reader_locate_entry(handle_, path.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    return ZipError::Ok;
}

}} // namespace sheetlens::archive
