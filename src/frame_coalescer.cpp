#include "blindxfer/frame_coalescer.hpp"

#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace blindxfer::stream {

namespace {

std::size_t FrameSizeFor(std::uint64_t plain_chunk_size) {
    if (plain_chunk_size == 0) {
        throw ProtocolError("Plain chunk size must be positive");
    }
    if (plain_chunk_size > std::numeric_limits<std::size_t>::max() - constants::kFrameOverhead) {
        throw ProtocolError("Plain chunk size too large");
    }
    return static_cast<std::size_t>(plain_chunk_size) + constants::kFrameOverhead;
}

}  // namespace

FrameCoalescer::FrameCoalescer(const Secret& key, std::uint64_t plain_chunk_size)
    : key_(key), frame_size_(FrameSizeFor(plain_chunk_size)) {}

void FrameCoalescer::CheckUsable() const {
    if (failed_) {
        throw AuthenticationError("Stream already failed authentication");
    }
}

void FrameCoalescer::Push(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    Push(Bytes(data, data + len));
}

void FrameCoalescer::Push(Bytes segment) {
    CheckUsable();
    if (finished_) {
        throw ProtocolError("Data pushed after end of stream");
    }
    if (segment.empty()) {
        return;
    }
    buffered_ += segment.size();
    segments_.push_back(std::move(segment));
}

void FrameCoalescer::CopyFront(std::uint8_t* out, std::size_t len) {
    std::size_t copied = 0;
    auto it = segments_.begin();
    std::size_t offset = front_offset_;
    while (copied < len) {
        std::size_t take = std::min(len - copied, it->size() - offset);
        std::memcpy(out + copied, it->data() + offset, take);
        copied += take;
        ++it;
        offset = 0;
    }
}

void FrameCoalescer::DropFront(std::size_t len) {
    buffered_ -= len;
    while (len > 0) {
        Bytes& front = segments_.front();
        std::size_t available = front.size() - front_offset_;
        if (len < available) {
            front_offset_ += len;
            return;
        }
        len -= available;
        segments_.pop_front();
        front_offset_ = 0;
    }
}

Bytes FrameCoalescer::DecodeFront(std::size_t len) {
    const std::uint8_t* frame = nullptr;
    const Bytes& front = segments_.front();
    if (front.size() - front_offset_ >= len) {
        frame = front.data() + front_offset_;
    } else {
        scratch_.resize(len);
        CopyFront(scratch_.data(), len);
        frame = scratch_.data();
    }
    Bytes plain;
    try {
        chunkcipher::DecodeInto(key_, frame, len, plain);
    } catch (const AuthenticationError&) {
        failed_ = true;
        segments_.clear();
        front_offset_ = 0;
        buffered_ = 0;
        throw;
    }
    DropFront(len);
    ++frames_decoded_;
    return plain;
}

std::optional<Bytes> FrameCoalescer::PopFrame() {
    CheckUsable();
    if (buffered_ < frame_size_) {
        return std::nullopt;
    }
    return DecodeFront(frame_size_);
}

std::vector<Bytes> FrameCoalescer::Update(const std::uint8_t* data, std::size_t len) {
    Push(data, len);
    std::vector<Bytes> out;
    while (auto plain = PopFrame()) {
        out.push_back(std::move(*plain));
    }
    return out;
}

std::optional<Bytes> FrameCoalescer::Finish() {
    CheckUsable();
    if (finished_) {
        return std::nullopt;
    }
    if (buffered_ >= frame_size_) {
        throw ProtocolError("Finish called with undrained full frames");
    }
    finished_ = true;
    if (buffered_ == 0) {
        return std::nullopt;
    }
    return DecodeFront(buffered_);
}

DecryptingReader::DecryptingReader(io::ByteSource& upstream, const Secret& key, std::uint64_t plain_chunk_size)
    : upstream_(&upstream), coalescer_(key, plain_chunk_size), read_buffer_(constants::kSourceReadSize) {}

DecryptingReader::DecryptingReader(std::unique_ptr<io::ByteSource> upstream,
                                   const Secret& key,
                                   std::uint64_t plain_chunk_size)
    : owned_(std::move(upstream)),
      upstream_(owned_.get()),
      coalescer_(key, plain_chunk_size),
      read_buffer_(constants::kSourceReadSize) {
    if (upstream_ == nullptr) {
        throw ProtocolError("Missing upstream source");
    }
}

std::optional<Bytes> DecryptingReader::Next() {
    while (true) {
        if (auto plain = coalescer_.PopFrame()) {
            plain_bytes_ += plain->size();
            return plain;
        }
        if (upstream_done_) {
            if (done_) {
                return std::nullopt;
            }
            done_ = true;
            auto tail = coalescer_.Finish();
            if (tail) {
                plain_bytes_ += tail->size();
            }
            return tail;
        }
        std::size_t got = upstream_->Read(read_buffer_.data(), read_buffer_.size());
        if (got == 0) {
            upstream_done_ = true;
        } else {
            coalescer_.Push(read_buffer_.data(), got);
        }
    }
}

std::size_t DecryptingReader::Read(std::uint8_t* out, std::size_t max) {
    while (pending_offset_ >= pending_.size()) {
        auto plain = Next();
        if (!plain) {
            return 0;
        }
        pending_ = std::move(*plain);
        pending_offset_ = 0;
    }
    std::size_t take = std::min(max, pending_.size() - pending_offset_);
    std::memcpy(out, pending_.data() + pending_offset_, take);
    pending_offset_ += take;
    return take;
}

}  // namespace blindxfer::stream
