#include "sheetlens/opc/Package.hpp"
#include "sheetlens/reader/RelationshipsParser.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace sheetlens {
namespace opc {

core::Result<std::unique_ptr<Package>> Package::open(std::vector<uint8_t> bytes) {
    std::unique_ptr<Package> package(new Package(std::move(bytes)));

    archive::ZipError result = package->reader_.openBuffer(package->bytes_.data(), package->bytes_.size());
    if (result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::InvalidArchive,
                               fmt::format("Not a readable zip archive ({})", archive::toString(result)));
    }

    OPC_DEBUG("Package opened: {} parts, {} bytes", package->partNames().size(), package->bytes_.size());
    return std::move(package);
}

core::Result<std::string> Package::part(const std::string& path) {
    std::string content;
    archive::ZipError result = reader_.extractFile(path, content);
    if (result == archive::ZipError::FileNotFound) {
        return core::makeError(core::ErrorCode::MissingPart, fmt::format("Part not found: {}", path), path);
    }
    if (result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::InvalidArchive,
                               fmt::format("Failed to extract part ({})", archive::toString(result)), path);
    }
    return content;
}

bool Package::hasPart(const std::string& path) const {
    return reader_.fileExists(path) == archive::ZipError::Ok;
}

core::Result<Relationships> Package::relationshipsOf(const std::string& part_path) {
    auto cached = rels_cache_.find(part_path);
    if (cached != rels_cache_.end()) {
        return cached->second;
    }

    const std::string rels_path = relationshipsPartFor(part_path);
    Relationships relationships;
    if (hasPart(rels_path)) {
        auto content = part(rels_path);
        if (!content) {
            return content.error();
        }
        reader::RelationshipsParser parser(part_path);
        auto parsed = parser.parse(content.value(), rels_path);
        if (!parsed) {
            return parsed.error();
        }
        relationships = Relationships(parser.takeRelationships());
        OPC_DEBUG("{}: {} relationships", rels_path, relationships.size());
    }

    rels_cache_.emplace(part_path, relationships);
    return relationships;
}

}} // namespace sheetlens::opc
