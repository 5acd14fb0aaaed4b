#include "peerdrop/transfer/chunk_source.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>

namespace peerdrop::transfer {

core::Result FileChunkSource::open(const std::filesystem::path& path, std::unique_ptr<ChunkSource>& out_source) {
    if (!core::utils::FileUtils::is_file(path)) {
        return core::Result(core::ErrorCode::IO_ERROR, "Not a regular file: " + path.string());
    }

    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot stat " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }

    TransferMetadata metadata;
    metadata.name = path.filename().string();
    metadata.size = *size;
    metadata.mime_type = core::utils::MimeUtils::guess_mime_type(path);

    out_source = std::make_unique<FileChunkSource>(OpenKey{}, path, std::move(file), std::move(metadata));
    return core::Result();
}

FileChunkSource::FileChunkSource(OpenKey, std::filesystem::path path, std::ifstream file, TransferMetadata metadata)
    : path_(std::move(path))
    , file_(std::move(file))
    , metadata_(std::move(metadata))
    , remaining_(metadata_.size) {
}

core::Result FileChunkSource::read(std::size_t max_bytes, std::vector<std::uint8_t>& out_chunk) {
    // Never read past the size announced in the metadata
    auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(max_bytes, remaining_));
    out_chunk.resize(wanted);
    if (wanted == 0) {
        return core::Result();
    }

    file_.read(reinterpret_cast<char*>(out_chunk.data()), static_cast<std::streamsize>(wanted));
    auto got = static_cast<std::size_t>(file_.gcount());
    if (got != wanted) {
        LOG_ERROR("Short read on {}: wanted {} bytes, got {}", path_.string(), wanted, got);
        out_chunk.resize(got);
        return core::Result(core::ErrorCode::IO_ERROR, "File " + path_.string() + " shrank while sending");
    }

    remaining_ -= got;
    return core::Result();
}

MemoryChunkSource::MemoryChunkSource(std::string name, std::string mime_type, std::vector<std::uint8_t> data)
    : data_(std::move(data))
    , offset_(0) {

    metadata_.name = std::move(name);
    metadata_.size = data_.size();
    metadata_.mime_type = mime_type.empty() ? "application/octet-stream" : std::move(mime_type);
}

core::Result MemoryChunkSource::read(std::size_t max_bytes, std::vector<std::uint8_t>& out_chunk) {
    auto count = std::min(max_bytes, data_.size() - offset_);
    out_chunk.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                     data_.begin() + static_cast<std::ptrdiff_t>(offset_ + count));
    offset_ += count;
    return core::Result();
}

}
