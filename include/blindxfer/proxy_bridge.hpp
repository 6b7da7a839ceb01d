#pragma once

#include "blindxfer/byte_source.hpp"
#include "blindxfer/config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>

namespace blindxfer::proxy {

// {type:"register", address, displayName, size, remoteSource, key, plainChunkSize}
struct Registration {
    std::string address;
    std::string display_name;
    std::uint64_t size = 0;
    std::string remote_source;
    std::string key;
    std::uint64_t plain_chunk_size = 0;
};

std::string EncodeRegistration(const Registration& registration);
// Throws ProtocolError for a wrong type or missing fields.
Registration ParseRegistration(std::string_view json);

// Fresh unguessable path under kVirtualPrefix.
std::string NewVirtualAddress();

using SourceFactory = std::function<std::unique_ptr<io::ByteSource>(const std::string& remote_source)>;

// http(s):// through HttpSource, file:// through FileSource.
std::unique_ptr<io::ByteSource> OpenRemoteSource(const std::string& remote_source, std::chrono::seconds timeout);

// Loopback HTTP listener that answers GETs of registered virtual addresses
// with the decrypted plaintext of their upstream source. Registrations are
// posted to a mailbox drained by the bridge's own thread, which acknowledges
// each one with "ready".
class ProxyBridge {
public:
    explicit ProxyBridge(config::TransferConfig config, SourceFactory factory = {});
    ~ProxyBridge();

    ProxyBridge(const ProxyBridge&) = delete;
    ProxyBridge& operator=(const ProxyBridge&) = delete;

    // Binds 127.0.0.1:<proxy_port> (0 picks a free port). Throws std::runtime_error.
    void Start();
    void Stop();
    bool Running() const noexcept { return running_.load(); }

    std::uint16_t Port() const noexcept { return port_.load(); }
    std::string BaseUrl() const;

    // Queues a registration; the future yields "ready" once it is live.
    // Registrations posted before Start are served once the bridge starts.
    std::future<std::string> Register(Registration registration);
    bool Unregister(const std::string& address);
    bool IsRegistered(const std::string& address) const;
    std::size_t RegisteredCount() const;

    // Registers, waits up to handshake_timeout for "ready" and returns the
    // virtual URL. On timeout throws ProtocolError unless optimistic_handshake
    // is set, in which case it logs a warning and returns the URL anyway.
    std::string Navigate(Registration registration);

private:
    struct Command {
        Registration registration;
        std::promise<std::string> reply;
    };

    void MailboxLoop();
    void AcceptLoop();
    void HandleConnection(int fd);
    void ServeRegister(int fd, const std::string& body);
    void ServeStream(int fd, const std::string& address, bool head_only);
    std::unique_ptr<io::ByteSource> OpenSource(const Registration& registration) const;
    void ReapWorkers(bool all);

    config::TransferConfig config_;
    SourceFactory factory_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint16_t> port_{0};
    int listen_fd_ = -1;
    std::thread accept_thread_;
    std::thread mailbox_thread_;

    std::mutex mailbox_mutex_;
    std::condition_variable mailbox_cv_;
    std::deque<Command> mailbox_;

    mutable std::mutex registry_mutex_;
    std::map<std::string, Registration> registry_;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::set<int> active_fds_;
};

}  // namespace blindxfer::proxy
