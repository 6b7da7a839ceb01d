#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <memory>
#include <vector>

namespace blindxfer::io {

using Bytes = std::vector<std::uint8_t>;

// Pull interface over a sequential byte stream. Read returns the number of
// bytes copied into `out` (at most `max`); 0 means end of input.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t Read(std::uint8_t* out, std::size_t max) = 0;
};

// Opens [offset, offset + length) of a stored object; length 0 means "to the end".
using RangeOpener = std::function<std::unique_ptr<ByteSource>(std::uint64_t offset, std::uint64_t length)>;

class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& input) : input_(input) {}

    std::size_t Read(std::uint8_t* out, std::size_t max) override;

private:
    std::istream& input_;
};

// In-memory source. A non-empty schedule caps the size of successive reads,
// cycling through the list; used to model irregular network delivery.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(Bytes data, std::vector<std::size_t> schedule = {});

    std::size_t Read(std::uint8_t* out, std::size_t max) override;

    std::size_t Remaining() const noexcept { return data_.size() - offset_; }

private:
    Bytes data_;
    std::vector<std::size_t> schedule_;
    std::size_t schedule_pos_ = 0;
    std::size_t offset_ = 0;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path,
                        std::uint64_t offset = 0,
                        std::uint64_t length = 0);

    std::size_t Read(std::uint8_t* out, std::size_t max) override;

    std::uint64_t TotalSize() const noexcept { return total_size_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t total_size_ = 0;
    std::uint64_t remaining_ = 0;
};

// Reads until `len` bytes are gathered or the source ends. Returns bytes read.
std::size_t ReadFull(ByteSource& source, std::uint8_t* out, std::size_t len);

}  // namespace blindxfer::io
