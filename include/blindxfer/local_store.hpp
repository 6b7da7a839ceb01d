#pragma once

#include "blindxfer/byte_source.hpp"
#include "blindxfer/multipart_client.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blindxfer::remote {

// Filesystem implementation of the multipart contract.
//
//   <root>/<id>.parts/manifest   session metadata while uploading
//   <root>/<id>.parts/part-NNNNN one frame per part
//   <root>/<id>.bin              finalized ciphertext object
//   <root>/<id>.meta             DownloadInfo as flat JSON
class LocalStore : public MultipartTransferClient {
public:
    // part_size 0 applies the service policy (plan::ChooseChunkSize).
    explicit LocalStore(std::filesystem::path root, std::uint64_t part_size = 0);

    UploadTicket Begin(const BeginRequest& request) override;
    std::string UploadPart(const UploadTicket& ticket,
                           std::uint32_t part_number,
                           const Bytes& frame) override;
    std::string Finalize(const UploadTicket& ticket, const std::vector<CompletedPart>& parts) override;
    void Abort(const UploadTicket& ticket) override;

    // Throws ProtocolError when the object is unknown or expired.
    DownloadInfo GetDownloadInfo(const std::string& id) const;
    std::unique_ptr<io::ByteSource> OpenObject(const std::string& id,
                                               std::uint64_t offset = 0,
                                               std::uint64_t length = 0) const;
    io::RangeOpener ObjectOpener(const std::string& id) const;

    std::filesystem::path ObjectPath(const std::string& id) const;
    const std::filesystem::path& Root() const noexcept { return root_; }

private:
    struct Manifest {
        std::string id;
        std::string upload_id;
        std::uint64_t file_size = 0;
        std::string content_type;
        std::uint64_t part_size = 0;
        std::uint64_t total_parts = 0;
        std::string encrypted_metadata;
        std::string created_at;
    };

    std::filesystem::path PartsDir(const std::string& id) const;
    std::filesystem::path PartPath(const std::string& id, std::uint32_t part_number) const;
    std::filesystem::path MetaPath(const std::string& id) const;
    Manifest LoadManifest(const UploadTicket& ticket) const;

    std::filesystem::path root_;
    std::uint64_t part_size_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace blindxfer::remote
