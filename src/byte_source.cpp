#include "blindxfer/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <stdexcept>
#include <utility>

namespace blindxfer::io {

std::size_t IstreamSource::Read(std::uint8_t* out, std::size_t max) {
    if (max == 0 || !input_) {
        return 0;
    }
    input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(max));
    std::size_t got = static_cast<std::size_t>(input_.gcount());
    if (input_.bad()) {
        throw std::runtime_error("Stream read failed");
    }
    return got;
}

MemorySource::MemorySource(Bytes data, std::vector<std::size_t> schedule)
    : data_(std::move(data)), schedule_(std::move(schedule)) {
    schedule_.erase(std::remove(schedule_.begin(), schedule_.end(), std::size_t{0}), schedule_.end());
}

std::size_t MemorySource::Read(std::uint8_t* out, std::size_t max) {
    std::size_t take = std::min(max, Remaining());
    if (!schedule_.empty() && take > 0) {
        take = std::min(take, schedule_[schedule_pos_]);
        schedule_pos_ = (schedule_pos_ + 1) % schedule_.size();
    }
    if (take > 0) {
        std::memcpy(out, data_.data() + offset_, take);
        offset_ += take;
    }
    return take;
}

FileSource::FileSource(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length)
    : path_(path), input_(path, std::ios::binary) {
    if (!input_) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    input_.seekg(0, std::ios::end);
    total_size_ = static_cast<std::uint64_t>(input_.tellg());
    if (offset > total_size_) {
        throw std::runtime_error("Read offset beyond end of file: " + path.string());
    }
    input_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    remaining_ = total_size_ - offset;
    if (length > 0) {
        remaining_ = std::min(remaining_, length);
    }
}

std::size_t FileSource::Read(std::uint8_t* out, std::size_t max) {
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(max, remaining_));
    if (want == 0) {
        return 0;
    }
    input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(input_.gcount());
    if (got == 0 && input_.bad()) {
        throw std::runtime_error("Failed to read file: " + path_.string());
    }
    remaining_ -= got;
    return got;
}

std::size_t ReadFull(ByteSource& source, std::uint8_t* out, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        std::size_t got = source.Read(out + total, len - total);
        if (got == 0) {
            break;
        }
        total += got;
    }
    return total;
}

}  // namespace blindxfer::io
