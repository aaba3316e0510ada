#include "sheetlens/archive/ZipWriter.hpp"
#include "sheetlens/archive/ZipReader.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>

namespace sheetlens {
namespace archive {

ZipWriter::ZipWriter(int compression_level)
    : compression_level_(compression_level < 0 ? 0 : (compression_level > 9 ? 9 : compression_level)) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipError ZipWriter::open() {
    cleanup();

    mem_stream_ = mz_stream_mem_create();
    if (!mem_stream_) {
        ARCHIVE_ERROR("Failed to create memory stream");
        return ZipError::InternalError;
    }
    mz_stream_mem_set_grow_size(mem_stream_, 128 * 1024);
    if (mz_stream_open(mem_stream_, nullptr, MZ_OPEN_MODE_CREATE) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open memory stream");
        cleanup();
        return ZipError::IoFail;
    }

    handle_ = mz_zip_writer_create();
    if (!handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        cleanup();
        return ZipError::InternalError;
    }
    mz_zip_writer_set_compress_method(handle_, compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE
                                                                       : MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(handle_, static_cast<int16_t>(compression_level_));

    int32_t result = mz_zip_writer_open(handle_, mem_stream_, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip writer on memory stream, error: {}", result);
        cleanup();
        return ZipError::IoFail;
    }

    stats_ = Stats{};
    written_paths_.clear();
    return ZipError::Ok;
}

ZipError ZipWriter::addFile(std::string_view internal_path, const void* data, size_t size) {
    if (!handle_) {
        ARCHIVE_ERROR("Zip writer not opened");
        return ZipError::NotOpen;
    }
    if (size > static_cast<size_t>(INT32_MAX)) {
        ARCHIVE_ERROR("Entry {} is too large ({} bytes)", internal_path, size);
        return ZipError::TooLarge;
    }
    if (!markWritten(internal_path)) {
        return ZipError::Ok;
    }

    const std::string path(internal_path);
    mz_zip_file file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE
                                                           : MZ_COMPRESS_METHOD_DEFLATE;
    file_info.modified_date = std::time(nullptr);
    file_info.version_madeby = MZ_VERSION_MADEBY;
    file_info.flag = MZ_ZIP_FLAG_UTF8;

    int32_t result = mz_zip_writer_entry_open(handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {}, error: {}", internal_path, result);
        return ZipError::IoFail;
    }
    if (size > 0) {
        int32_t written = mz_zip_writer_entry_write(handle_, data, static_cast<int32_t>(size));
        if (written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Short write for entry {}: {} of {} bytes", internal_path, written, size);
            mz_zip_writer_entry_close(handle_);
            return ZipError::CompressionFail;
        }
    }
    result = mz_zip_writer_entry_close(handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry {}, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    stats_.entries_written++;
    stats_.bytes_written += size;
    SHEETLENS_LOG_ZIP_DEBUG("Added {} ({} bytes)", internal_path, size);
    return ZipError::Ok;
}

ZipError ZipWriter::copyRawFrom(ZipReader& reader, std::string_view internal_path) {
    if (!handle_) {
        return ZipError::NotOpen;
    }
    ZipError located = reader.locateEntry(internal_path);
    if (located != ZipError::Ok) {
        ARCHIVE_ERROR("Cannot copy {}: {}", internal_path, toString(located));
        return located;
    }
    if (!markWritten(internal_path)) {
        return ZipError::Ok;
    }

    int32_t result = mz_zip_writer_copy_from_reader(handle_, reader.handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Raw copy of {} failed, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    ZipReader::EntryInfo info;
    if (reader.getEntryInfo(internal_path, info)) {
        stats_.bytes_written += static_cast<size_t>(info.compressed_size);
    }
    stats_.entries_copied++;
    SHEETLENS_LOG_ZIP_DEBUG("Copied {} raw", internal_path);
    return ZipError::Ok;
}

ZipError ZipWriter::finish(std::vector<uint8_t>& output) {
    if (!handle_) {
        return ZipError::NotOpen;
    }

    int32_t result = mz_zip_writer_close(handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize zip central directory, error: {}", result);
        cleanup();
        return ZipError::IoFail;
    }

    const void* buffer = nullptr;
    int32_t length = 0;
    if (mz_stream_mem_get_buffer(mem_stream_, &buffer) != MZ_OK ||
        mz_stream_mem_get_buffer_length(mem_stream_, &length) != MZ_OK || !buffer || length < 0) {
        ARCHIVE_ERROR("Failed to read back memory stream");
        cleanup();
        return ZipError::InternalError;
    }

    const auto* bytes = static_cast<const uint8_t*>(buffer);
    output.assign(bytes, bytes + length);
    ARCHIVE_DEBUG("Zip finished: {} entries written, {} copied, {} bytes",
                  stats_.entries_written, stats_.entries_copied, output.size());
    cleanup();
    return ZipError::Ok;
}

void ZipWriter::cleanup() {
    if (handle_) {
        mz_zip_writer_delete(&handle_);
        handle_ = nullptr;
    }
    if (mem_stream_) {
        mz_stream_close(mem_stream_);
        mz_stream_mem_delete(&mem_stream_);
        mem_stream_ = nullptr;
    }
}

bool ZipWriter::markWritten(std::string_view internal_path) {
    auto inserted = written_paths_.emplace(internal_path);
    if (!inserted.second) {
        ARCHIVE_WARN("Entry {} already written, skipping duplicate", internal_path);
        return false;
    }
    return true;
}

}} // namespace sheetlens::archive
