#pragma once

#include "blindxfer/byte_source.hpp"
#include "blindxfer/frame_coalescer.hpp"
#include "blindxfer/multipart_client.hpp"
#include "blindxfer/progress.hpp"
#include "blindxfer/secret.hpp"
#include "blindxfer/transfer_plan.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace blindxfer::download {

struct ShareLink {
    std::string base;
    std::string id;
    Secret key;
};

// Accepts "<base>/download/<id>#<key>" or "<id>#<key>". The key is only ever
// taken from the fragment. A passphrase-wrapped fragment ("<salt>.<key>") is
// unwrapped with `passphrase`. Throws ProtocolError, or AuthenticationError
// for a wrong passphrase.
ShareLink ParseShareLink(const std::string& link, const std::string& passphrase = "");

// Strips path separators, quotes and control characters.
std::string SanitizeFileName(const std::string& name);

// Receiver side of one transfer. Refuses to start when the persisted chunk
// size is missing or disagrees with the part count.
class DownloadSession {
public:
    DownloadSession(remote::DownloadInfo info, Secret key, io::RangeOpener opener);

    const remote::DownloadInfo& Info() const noexcept { return info_; }
    const plan::TransferPlan& Plan() const noexcept { return plan_; }

    // Name from the encrypted metadata, else the stored name.
    std::string ResolveDisplayName() const;

    // Sequential plaintext over the whole object.
    std::unique_ptr<stream::DecryptingReader> OpenPlaintext() const;

    // Writes the plaintext to `out`. Stops at the first AuthenticationError;
    // whatever was written before it must be discarded by the caller.
    std::uint64_t StreamTo(std::ostream& out, const progress::Callback& on_progress = {});

    // Fetches and decodes a single part (zero-based) with a ranged read.
    stream::Bytes FetchPart(std::uint64_t index) const;

    std::uint64_t BytesWritten() const noexcept { return bytes_written_; }

private:
    remote::DownloadInfo info_;
    Secret key_;
    io::RangeOpener opener_;
    plan::TransferPlan plan_;
    std::uint64_t bytes_written_ = 0;
};

}  // namespace blindxfer::download
