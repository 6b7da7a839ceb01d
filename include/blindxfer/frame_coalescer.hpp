#pragma once

#include "blindxfer/byte_source.hpp"
#include "blindxfer/secret.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace blindxfer::stream {

using Bytes = std::vector<std::uint8_t>;

// Reassembles arbitrarily sized reads into frames of plain_chunk_size + 28
// bytes and decodes them in order. Only the frame left over at end of input
// may be shorter. After an AuthenticationError every later call throws too.
class FrameCoalescer {
public:
    FrameCoalescer(const Secret& key, std::uint64_t plain_chunk_size);

    void Push(const std::uint8_t* data, std::size_t len);
    void Push(Bytes segment);

    // Decodes the oldest complete frame, or returns std::nullopt when fewer
    // than FrameSize() bytes are buffered.
    std::optional<Bytes> PopFrame();

    // Push followed by PopFrame until no full frame is left.
    std::vector<Bytes> Update(const std::uint8_t* data, std::size_t len);

    // End of input: decodes the remainder as the final frame. std::nullopt when
    // nothing is buffered.
    std::optional<Bytes> Finish();

    std::size_t FrameSize() const noexcept { return frame_size_; }
    std::size_t Buffered() const noexcept { return buffered_; }
    std::uint64_t FramesDecoded() const noexcept { return frames_decoded_; }

private:
    void CheckUsable() const;
    Bytes DecodeFront(std::size_t len);
    void CopyFront(std::uint8_t* out, std::size_t len);
    void DropFront(std::size_t len);

    Secret key_;
    std::size_t frame_size_;
    std::deque<Bytes> segments_;
    std::size_t front_offset_ = 0;
    std::size_t buffered_ = 0;
    Bytes scratch_;
    std::uint64_t frames_decoded_ = 0;
    bool failed_ = false;
    bool finished_ = false;
};

// Pull adapter: upstream ciphertext in, plaintext out. Memory stays bounded by
// one read buffer plus one frame.
class DecryptingReader : public io::ByteSource {
public:
    DecryptingReader(io::ByteSource& upstream, const Secret& key, std::uint64_t plain_chunk_size);
    DecryptingReader(std::unique_ptr<io::ByteSource> upstream, const Secret& key, std::uint64_t plain_chunk_size);

    // Next decoded chunk in stream order; std::nullopt at the end.
    // Throws AuthenticationError for a corrupt or truncated frame.
    std::optional<Bytes> Next();

    std::size_t Read(std::uint8_t* out, std::size_t max) override;

    std::uint64_t PlainBytes() const noexcept { return plain_bytes_; }
    std::uint64_t FramesDecoded() const noexcept { return coalescer_.FramesDecoded(); }

private:
    std::unique_ptr<io::ByteSource> owned_;
    io::ByteSource* upstream_;
    FrameCoalescer coalescer_;
    Bytes read_buffer_;
    Bytes pending_;
    std::size_t pending_offset_ = 0;
    std::uint64_t plain_bytes_ = 0;
    bool upstream_done_ = false;
    bool done_ = false;
};

}  // namespace blindxfer::stream
