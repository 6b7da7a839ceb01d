#pragma once

#include "blindxfer/chunk_cipher.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace blindxfer::remote {

using Bytes = std::vector<std::uint8_t>;

// Result of Begin. The service may pick plain_chunk_size on its own and the
// client must honor it.
struct UploadTicket {
    std::string session_id;
    std::string remote_upload_id;
    std::string object_key;
    std::uint64_t plain_chunk_size = 0;
    std::uint64_t total_parts = 0;
    std::string expires_at;
};

struct CompletedPart {
    std::uint32_t part_number = 0;
    std::string etag;
};

struct BeginRequest {
    std::uint64_t total_size = 0;
    std::string content_type;
    std::string encrypted_metadata;
};

// Metadata persisted alongside the object and trusted as-is by the receiver.
struct DownloadInfo {
    std::string id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string content_type;
    std::uint64_t plain_chunk_size = 0;
    std::uint64_t total_parts = 0;
    std::string expires_at;
    std::string created_at;
    std::string encrypted_metadata;
};

class MultipartTransferClient {
public:
    virtual ~MultipartTransferClient() = default;

    virtual UploadTicket Begin(const BeginRequest& request) = 0;

    // Throws TransportError for retryable failures.
    virtual std::string UploadPart(const UploadTicket& ticket,
                                   std::uint32_t part_number,
                                   const Bytes& frame) = 0;

    // `parts` must be sorted ascending by part number with no gaps.
    virtual std::string Finalize(const UploadTicket& ticket,
                                 const std::vector<CompletedPart>& parts) = 0;

    // Best effort. Safe after Finalize and for sessions that were never created.
    virtual void Abort(const UploadTicket& ticket) = 0;
};

}  // namespace blindxfer::remote
