#pragma once

#include "blindxfer/byte_source.hpp"
#include "blindxfer/config.hpp"
#include "blindxfer/multipart_client.hpp"

#include <curl/curl.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blindxfer::remote {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Runs curl_global_init exactly once per process.
void EnsureCurlGlobalInit();

std::string UrlEncode(std::string_view value);

// Blocking request. Throws TransportError when no HTTP response was received;
// any status code is returned to the caller.
HttpResponse PerformRequest(const std::string& method,
                            const std::string& url,
                            const std::vector<std::string>& headers,
                            std::string_view body,
                            std::chrono::seconds timeout);

// Maps a non-2xx response: 5xx, 408 and 429 to TransportError, everything
// else to ProtocolError carrying the service's "error" field when present.
void ThrowForStatus(const HttpResponse& response, const std::string& what);

// Storage API client. Every call uses its own easy handle, so UploadPart may
// run concurrently from several threads.
class HttpMultipartClient : public MultipartTransferClient {
public:
    explicit HttpMultipartClient(config::TransferConfig config);

    UploadTicket Begin(const BeginRequest& request) override;
    std::string UploadPart(const UploadTicket& ticket,
                           std::uint32_t part_number,
                           const Bytes& frame) override;
    std::string Finalize(const UploadTicket& ticket, const std::vector<CompletedPart>& parts) override;
    void Abort(const UploadTicket& ticket) override;

    DownloadInfo GetDownloadInfo(const std::string& id);
    std::string ObjectUrl(const std::string& id) const;
    io::RangeOpener ObjectOpener(const std::string& id) const;

private:
    std::vector<std::string> Headers(std::string_view content_type) const;
    HttpResponse Send(const std::string& method,
                      const std::string& path,
                      std::string_view body,
                      std::string_view content_type) const;

    config::TransferConfig config_;
};

// Streams a (ranged) GET through a curl multi handle. The transfer is paused
// while kHttpSourceHighWater bytes are waiting to be read.
class HttpSource : public io::ByteSource {
public:
    HttpSource(std::string url,
               std::uint64_t offset = 0,
               std::uint64_t length = 0,
               std::vector<std::string> headers = {},
               std::chrono::seconds timeout = std::chrono::seconds(300));
    ~HttpSource() override;

    HttpSource(const HttpSource&) = delete;
    HttpSource& operator=(const HttpSource&) = delete;

    std::size_t Read(std::uint8_t* out, std::size_t max) override;

    long Status() const noexcept { return status_; }

private:
    static std::size_t WriteCallback(char* data, std::size_t size, std::size_t nmemb, void* user);
    std::size_t OnData(const char* data, std::size_t len);
    void Pump();
    void Complete(int curl_code);

    std::string url_;
    bool ranged_ = false;
    std::uint64_t offset_ = 0;
    std::vector<std::string> header_store_;
    curl_slist* header_list_ = nullptr;
    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    Bytes buffer_;
    std::size_t buffer_offset_ = 0;
    std::string error_body_;
    long status_ = 0;
    bool paused_ = false;
    bool done_ = false;
};

}  // namespace blindxfer::remote
