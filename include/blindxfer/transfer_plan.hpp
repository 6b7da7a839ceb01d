#pragma once

#include "blindxfer/multipart_client.hpp"

#include <cstdint>

namespace blindxfer::plan {

struct TransferPlan {
    std::uint64_t total_plaintext_size = 0;
    std::uint64_t plain_chunk_size = 0;
    std::uint64_t total_parts = 0;
};

// Throws ProtocolError when chunk_size is zero.
TransferPlan MakePlan(std::uint64_t total_size, std::uint64_t chunk_size);

// `index` is zero based; part number is index + 1.
std::uint64_t PlainSizeOfPart(const TransferPlan& plan, std::uint64_t index);
std::uint64_t FrameSizeOfPart(const TransferPlan& plan, std::uint64_t index);
std::uint64_t CiphertextOffsetOfPart(const TransferPlan& plan, std::uint64_t index);
std::uint64_t EncryptedSize(const TransferPlan& plan);

// 10 MiB by default, grown so the file fits in kMaxParts, capped at kMaxPartSize.
std::uint64_t ChooseChunkSize(std::uint64_t total_size);

// Rejects tickets whose part count disagrees with the chunk size.
void ValidateTicket(const remote::UploadTicket& ticket, std::uint64_t total_size);

}  // namespace blindxfer::plan
