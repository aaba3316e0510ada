#include "sheetlens/opc/ZipRepackWriter.hpp"
#include "sheetlens/archive/ZipReader.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace sheetlens {
namespace opc {

ZipRepackWriter::ZipRepackWriter(int compression_level) : zip_(compression_level) {
}

core::VoidResult ZipRepackWriter::ensureOpen() {
    if (zip_.isOpen()) {
        return {};
    }
    archive::ZipError result = zip_.open();
    if (result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::ZipWriteError,
                               fmt::format("Cannot create output archive ({})", archive::toString(result)));
    }
    return {};
}

bool ZipRepackWriter::hasEntry(const std::string& path) const {
    return std::find(written_.begin(), written_.end(), path) != written_.end();
}

core::VoidResult ZipRepackWriter::add(const std::string& path, const std::string& content) {
    auto opened = ensureOpen();
    if (!opened) {
        return opened;
    }
    if (hasEntry(path)) {
        OPC_DEBUG("Entry already written: {}", path);
        return {};
    }

    archive::ZipError result = zip_.addFile(path, content);
    if (result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::ZipWriteError,
                               fmt::format("Failed to add entry ({})", archive::toString(result)), path);
    }
    written_.push_back(path);
    stats_.entries_added++;
    OPC_DEBUG("Added entry: {} ({} bytes)", path, content.size());
    return {};
}

core::VoidResult ZipRepackWriter::copyFrom(archive::ZipReader& source, const std::string& entry_path) {
    auto opened = ensureOpen();
    if (!opened) {
        return opened;
    }
    if (hasEntry(entry_path)) {
        OPC_DEBUG("Entry already written: {}", entry_path);
        return {};
    }

    archive::ZipError result = zip_.copyRawFrom(source, entry_path);
    if (result == archive::ZipError::FileNotFound) {
        return core::makeError(core::ErrorCode::MissingPart, "Source entry not found", entry_path);
    }
    if (result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::ZipWriteError,
                               fmt::format("Failed to copy entry ({})", archive::toString(result)), entry_path);
    }
    written_.push_back(entry_path);
    stats_.entries_copied++;
    return {};
}

core::Result<std::vector<uint8_t>> ZipRepackWriter::finish() {
    auto opened = ensureOpen();
    if (!opened) {
        return opened.error();
    }

    std::vector<uint8_t> output;
    archive::ZipError result = zip_.finish(output);
    if (result != archive::ZipError::Ok) {
        OPC_ERROR("Failed to finalize repacked zip: {}", archive::toString(result));
        return core::makeError(core::ErrorCode::ZipWriteError,
                               fmt::format("Failed to finalize archive ({})", archive::toString(result)));
    }

    OPC_INFO("Repack finished: {} entries added, {} entries copied, {} bytes",
             stats_.entries_added, stats_.entries_copied, output.size());
    return output;
}

}} // namespace sheetlens::opc
