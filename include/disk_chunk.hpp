// include/disk_chunk.hpp
#pragma once

#include <filesystem>

#include "chunk.hpp"

namespace SnapFetch {
namespace Chunks {

// Chunk whose bytes live in a file. Thread safe: every read opens its own handle,
// so any number of readers may use the same chunk at once. The file's lifecycle
// belongs to the store that created it, not to this object.
class DiskChunk final : public Chunk {
public:
    // Throws std::invalid_argument if file is empty. The checksum is copied in.
    DiskChunk(const Checksum::Bytes& checksum, std::filesystem::path file);

    Checksum::Bytes checksum() const override;
    std::unique_ptr<std::istream> inputStream() const override;
    std::uint64_t copyTo(std::ostream& output) const override;
    std::string toString() const override;

    const std::filesystem::path& file() const { return file_; }

private:
    const Checksum::Bytes checksum_;
    const std::filesystem::path file_;
};

} // namespace Chunks
} // namespace SnapFetch
