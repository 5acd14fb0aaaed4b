#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace peerdrop::transfer {

// Sequential reader for the bytes of one outbound file
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual const TransferMetadata& metadata() const = 0;

    // Reads up to `max_bytes` into `out_chunk`; an empty chunk means the end
    virtual core::Result read(std::size_t max_bytes, std::vector<std::uint8_t>& out_chunk) = 0;
};

class FileChunkSource : public ChunkSource {
    // Only open() can name this, so only open() can construct
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    static core::Result open(const std::filesystem::path& path, std::unique_ptr<ChunkSource>& out_source);

    FileChunkSource(OpenKey, std::filesystem::path path, std::ifstream file, TransferMetadata metadata);

    const TransferMetadata& metadata() const override { return metadata_; }
    core::Result read(std::size_t max_bytes, std::vector<std::uint8_t>& out_chunk) override;

private:

    std::filesystem::path path_;
    std::ifstream file_;
    TransferMetadata metadata_;
    std::uint64_t remaining_;
};

class MemoryChunkSource : public ChunkSource {
public:
    MemoryChunkSource(std::string name, std::string mime_type, std::vector<std::uint8_t> data);

    const TransferMetadata& metadata() const override { return metadata_; }
    core::Result read(std::size_t max_bytes, std::vector<std::uint8_t>& out_chunk) override;

private:
    TransferMetadata metadata_;
    std::vector<std::uint8_t> data_;
    std::size_t offset_;
};

}
