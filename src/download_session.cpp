#include "blindxfer/download_session.hpp"

#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/passphrase.hpp"

#include <chrono>
#include <ostream>

namespace blindxfer::download {

namespace {

constexpr const char* kComponent = "download";

plan::TransferPlan CheckedPlan(const remote::DownloadInfo& info) {
    if (info.file_size == 0) {
        throw ProtocolError("Download metadata is missing the file size");
    }
    if (info.plain_chunk_size == 0) {
        throw ProtocolError("Download metadata is missing the part size");
    }
    plan::TransferPlan plan = plan::MakePlan(info.file_size, info.plain_chunk_size);
    if (info.total_parts != 0 && info.total_parts != plan.total_parts) {
        throw ProtocolError("Part count mismatch: metadata says " + std::to_string(info.total_parts)
                            + ", part size implies " + std::to_string(plan.total_parts));
    }
    return plan;
}

}  // namespace

ShareLink ParseShareLink(const std::string& link, const std::string& phrase) {
    std::size_t hash = link.find('#');
    if (hash == std::string::npos || hash + 1 >= link.size()) {
        throw ProtocolError("Share link has no key fragment");
    }
    std::string head = link.substr(0, hash);
    std::string fragment = link.substr(hash + 1);
    while (!head.empty() && head.back() == '/') {
        head.pop_back();
    }
    ShareLink out;
    std::size_t marker = head.rfind("/download/");
    if (marker != std::string::npos) {
        out.base = head.substr(0, marker);
        out.id = head.substr(marker + std::string("/download/").size());
    } else {
        out.id = head;
    }
    std::size_t query = out.id.find('?');
    if (query != std::string::npos) {
        out.id.resize(query);
    }
    if (out.id.empty() || out.id.find('/') != std::string::npos) {
        throw ProtocolError("Share link has no file id");
    }
    if (passphrase::IsWrapped(fragment)) {
        if (phrase.empty()) {
            throw ProtocolError("Share link key is passphrase-protected");
        }
        out.key = passphrase::UnwrapKey(fragment, phrase);
    } else {
        out.key = Secret::FromBase64Url(fragment);
    }
    return out;
}

std::string SanitizeFileName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == '"' || uc < 0x20 || uc == 0x7F) {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    if (out.empty() || out == "." || out == "..") {
        return std::string(constants::kNeutralObjectName);
    }
    return out;
}

DownloadSession::DownloadSession(remote::DownloadInfo info, Secret key, io::RangeOpener opener)
    : info_(std::move(info)), key_(std::move(key)), opener_(std::move(opener)), plan_(CheckedPlan(info_)) {
    if (!opener_) {
        throw ProtocolError("Download session has no object source");
    }
}

std::string DownloadSession::ResolveDisplayName() const {
    if (!info_.encrypted_metadata.empty()) {
        try {
            chunkcipher::FileMetadata meta = chunkcipher::DecryptMetadata(key_, info_.encrypted_metadata);
            if (!meta.name.empty()) {
                return SanitizeFileName(meta.name);
            }
        } catch (const AuthenticationError& ex) {
            log::Warn(kComponent, std::string("cannot decrypt file metadata: ") + ex.what());
        } catch (const ProtocolError& ex) {
            log::Warn(kComponent, std::string("invalid file metadata: ") + ex.what());
        }
    }
    return SanitizeFileName(info_.file_name);
}

std::unique_ptr<stream::DecryptingReader> DownloadSession::OpenPlaintext() const {
    return std::make_unique<stream::DecryptingReader>(opener_(0, 0), key_, plan_.plain_chunk_size);
}

std::uint64_t DownloadSession::StreamTo(std::ostream& out, const progress::Callback& on_progress) {
    auto reader = OpenPlaintext();
    progress::ThroughputMeter meter(std::chrono::milliseconds(constants::kDefaultThroughputWindowMs));
    bytes_written_ = 0;
    std::uint64_t parts = 0;
    while (auto chunk = reader->Next()) {
        out.write(reinterpret_cast<const char*>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
        if (!out) {
            throw std::runtime_error("Failed to write plaintext output");
        }
        bytes_written_ += chunk->size();
        ++parts;
        meter.Record(chunk->size());
        if (on_progress) {
            progress::Snapshot snapshot;
            snapshot.completed_parts = parts;
            snapshot.total_parts = plan_.total_parts;
            snapshot.completed_bytes = bytes_written_;
            snapshot.total_bytes = plan_.total_plaintext_size;
            snapshot.bytes_per_second = meter.BytesPerSecond();
            if (snapshot.bytes_per_second > 0.0 && bytes_written_ <= plan_.total_plaintext_size) {
                snapshot.seconds_remaining =
                    static_cast<double>(plan_.total_plaintext_size - bytes_written_) / snapshot.bytes_per_second;
            }
            on_progress(snapshot);
        }
    }
    out.flush();
    if (parts != plan_.total_parts || bytes_written_ != plan_.total_plaintext_size) {
        throw ProtocolError("Stream ended after " + std::to_string(parts) + " of "
                            + std::to_string(plan_.total_parts) + " parts (" + std::to_string(bytes_written_)
                            + " of " + std::to_string(plan_.total_plaintext_size) + " bytes)");
    }
    return bytes_written_;
}

stream::Bytes DownloadSession::FetchPart(std::uint64_t index) const {
    std::uint64_t offset = plan::CiphertextOffsetOfPart(plan_, index);
    std::uint64_t length = plan::FrameSizeOfPart(plan_, index);
    std::unique_ptr<io::ByteSource> source = opener_(offset, length);
    stream::Bytes frame(static_cast<std::size_t>(length));
    std::size_t got = io::ReadFull(*source, frame.data(), frame.size());
    if (got != frame.size()) {
        throw ProtocolError("Part " + std::to_string(index + 1) + " truncated: got " + std::to_string(got)
                            + " of " + std::to_string(length) + " bytes");
    }
    return chunkcipher::Decode(key_, frame);
}

}  // namespace blindxfer::download
