// include/chunk.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "checksum_utility.hpp"

namespace SnapFetch {
namespace Chunks {

// Immutable, checksum-identified unit of retrieved content. Implementations
// decide where the bytes live; identity is the checksum alone.
class Chunk {
public:
    virtual ~Chunk() = default;

    // A fresh copy on every call. Mutating it does not affect the chunk.
    virtual Checksum::Bytes checksum() const = 0;

    // Fresh, independently positioned stream over the whole content. The caller owns it.
    virtual std::unique_ptr<std::istream> inputStream() const = 0;

    // Stream the whole content into output and return the number of bytes written.
    virtual std::uint64_t copyTo(std::ostream& output) const = 0;

    virtual std::string toString() const = 0;
};

// Equality and hashing look at checksum bytes only, never at the backing storage.
bool operator==(const Chunk& lhs, const Chunk& rhs);
bool operator!=(const Chunk& lhs, const Chunk& rhs);

struct ChunkHash {
    size_t operator()(const Chunk& chunk) const;
    size_t operator()(const std::shared_ptr<const Chunk>& chunk) const;
};

struct ChunkEqual {
    bool operator()(const std::shared_ptr<const Chunk>& lhs, const std::shared_ptr<const Chunk>& rhs) const;
};

} // namespace Chunks
} // namespace SnapFetch
