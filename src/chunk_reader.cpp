#include "blindxfer/chunk_reader.hpp"

#include "blindxfer/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace blindxfer::io {

ChunkReader::ChunkReader(ByteSource& source, std::uint64_t plain_chunk_size, std::uint64_t total_size)
    : source_(source), chunk_size_(plain_chunk_size), total_size_(total_size) {
    if (chunk_size_ == 0) {
        throw ProtocolError("Plain chunk size must be positive");
    }
}

std::optional<PlainChunk> ChunkReader::Next() {
    if (offset_ >= total_size_) {
        return std::nullopt;
    }
    std::uint64_t want = std::min(chunk_size_, total_size_ - offset_);
    PlainChunk chunk;
    chunk.part_number = next_part_;
    chunk.data.resize(static_cast<std::size_t>(want));
    std::size_t got = ReadFull(source_, chunk.data.data(), chunk.data.size());
    if (got != want) {
        throw std::runtime_error("Input ended at offset " + std::to_string(offset_ + got)
                                 + ", expected " + std::to_string(total_size_) + " bytes");
    }
    offset_ += want;
    ++next_part_;
    chunk.is_last = offset_ == total_size_;
    return chunk;
}

}  // namespace blindxfer::io
