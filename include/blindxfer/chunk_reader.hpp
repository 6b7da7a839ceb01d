#pragma once

#include "blindxfer/byte_source.hpp"

#include <cstdint>
#include <optional>

namespace blindxfer::io {

struct PlainChunk {
    std::uint32_t part_number = 0;
    Bytes data;
    bool is_last = false;
};

// Slices a source of known length into plain_chunk_size pieces, one at a
// time. Only the final chunk may be shorter.
class ChunkReader {
public:
    ChunkReader(ByteSource& source, std::uint64_t plain_chunk_size, std::uint64_t total_size);

    // std::nullopt once every chunk was returned. Throws std::runtime_error if
    // the source ends before total_size bytes were read.
    std::optional<PlainChunk> Next();

    std::uint64_t Offset() const noexcept { return offset_; }
    std::uint64_t TotalSize() const noexcept { return total_size_; }

private:
    ByteSource& source_;
    std::uint64_t chunk_size_;
    std::uint64_t total_size_;
    std::uint64_t offset_ = 0;
    std::uint32_t next_part_ = 1;
};

}  // namespace blindxfer::io
