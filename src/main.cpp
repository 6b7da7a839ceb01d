#include "blindxfer/cancellation.hpp"
#include "blindxfer/cli_colors.hpp"
#include "blindxfer/config.hpp"
#include "blindxfer/download_session.hpp"
#include "blindxfer/http_client.hpp"
#include "blindxfer/local_store.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/passphrase.hpp"
#include "blindxfer/progress.hpp"
#include "blindxfer/proxy_bridge.hpp"
#include "blindxfer/secret.hpp"
#include "blindxfer/transfer_plan.hpp"
#include "blindxfer/uploader.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void OnSignal(int) {
    g_interrupted = 1;
}

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  blindxfer keygen\n";
    std::cout << "  blindxfer plan <size> [--chunk <bytes>]\n";
    std::cout << "  blindxfer upload <file> [--api <url> | --store <dir>] [--max-in-flight <k>] [--content-type <type>] [--chunk <bytes>] [--passphrase <p>]\n";
    std::cout << "  blindxfer download <link|id> [--key <key>] [--api <url> | --store <dir>] [--out <path>] [--part <n>] [--passphrase <p>]\n";
    std::cout << "  blindxfer proxy-serve [--port <n>]\n";
    std::cout << "  blindxfer proxy-fetch <link|id> [--key <key>] [--api <url> | --store <dir>] [--out <path>] [--port <n>] [--passphrase <p>]\n";
    std::cout << "Global flags: --no-color --verbose\n";
}

struct CliArgs {
    std::vector<std::string> positional;
    std::string api;
    std::string store;
    std::string key;
    std::string passphrase;
    std::string output;
    std::string content_type;
    std::uint64_t chunk = 0;
    std::size_t max_in_flight = 0;
    std::optional<std::uint64_t> part;
    std::optional<std::uint16_t> port;
};

std::uint64_t ParseNumber(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &used, 10);
    } catch (const std::exception&) {
        throw UsageError("Invalid number for " + flag + ": " + value);
    }
    if (used != value.size()) {
        throw UsageError("Invalid number for " + flag + ": " + value);
    }
    return static_cast<std::uint64_t>(parsed);
}

CliArgs ParseArgs(int argc, char** argv, int start_index) {
    CliArgs opts;
    int idx = start_index;
    auto value_of = [&](const std::string& flag) -> std::string {
        if (idx + 1 >= argc) {
            throw UsageError("Missing value for " + flag);
        }
        std::string value = argv[idx + 1];
        idx += 2;
        return value;
    };
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--api") {
            opts.api = value_of(flag);
        } else if (flag == "--store") {
            opts.store = value_of(flag);
        } else if (flag == "--key" || flag == "-k") {
            opts.key = value_of(flag);
        } else if (flag == "--passphrase") {
            opts.passphrase = value_of(flag);
            if (opts.passphrase.empty()) {
                throw UsageError("--passphrase must not be empty");
            }
        } else if (flag == "--out" || flag == "-o") {
            opts.output = value_of(flag);
        } else if (flag == "--content-type") {
            opts.content_type = value_of(flag);
        } else if (flag == "--chunk") {
            opts.chunk = ParseNumber(flag, value_of(flag));
        } else if (flag == "--max-in-flight") {
            opts.max_in_flight = static_cast<std::size_t>(ParseNumber(flag, value_of(flag)));
        } else if (flag == "--part") {
            opts.part = ParseNumber(flag, value_of(flag));
        } else if (flag == "--port") {
            std::uint64_t port = ParseNumber(flag, value_of(flag));
            if (port > 65535) {
                throw UsageError("Port out of range: " + std::to_string(port));
            }
            opts.port = static_cast<std::uint16_t>(port);
        } else if (flag == "--no-color" || flag == "--verbose") {
            idx += 1;
        } else if (!flag.empty() && flag[0] == '-') {
            throw UsageError("Unknown flag: " + flag);
        } else {
            opts.positional.push_back(flag);
            idx += 1;
        }
    }
    if (!opts.api.empty() && !opts.store.empty()) {
        throw UsageError("--api and --store are mutually exclusive");
    }
    return opts;
}

const std::string& RequirePositional(const CliArgs& args, const char* what) {
    if (args.positional.empty()) {
        throw UsageError(std::string("Missing ") + what);
    }
    if (args.positional.size() > 1) {
        throw UsageError("Unexpected argument: " + args.positional[1]);
    }
    return args.positional.front();
}

// Either the local directory store or the HTTP storage API.
struct Backend {
    std::unique_ptr<blindxfer::remote::LocalStore> store;
    std::unique_ptr<blindxfer::remote::HttpMultipartClient> http;

    blindxfer::remote::MultipartTransferClient& Client() {
        if (store) {
            return *store;
        }
        return *http;
    }

    blindxfer::remote::DownloadInfo Info(const std::string& id) {
        return store ? store->GetDownloadInfo(id) : http->GetDownloadInfo(id);
    }

    blindxfer::io::RangeOpener Opener(const std::string& id) const {
        return store ? store->ObjectOpener(id) : http->ObjectOpener(id);
    }

    std::string ObjectSource(const std::string& id) const {
        return store ? "file://" + store->ObjectPath(id).string() : http->ObjectUrl(id);
    }
};

Backend MakeBackend(const CliArgs& args, const blindxfer::config::TransferConfig& config) {
    Backend backend;
    if (!args.store.empty()) {
        backend.store = std::make_unique<blindxfer::remote::LocalStore>(args.store, args.chunk);
    } else {
        backend.http = std::make_unique<blindxfer::remote::HttpMultipartClient>(config);
    }
    return backend;
}

blindxfer::config::TransferConfig MakeConfig(const CliArgs& args) {
    blindxfer::config::TransferConfig config = blindxfer::config::FromEnvironment();
    if (!args.api.empty()) {
        config.api_base = args.api;
    }
    if (args.max_in_flight != 0) {
        config.max_in_flight = args.max_in_flight;
    }
    if (args.port) {
        config.proxy_port = *args.port;
    }
    blindxfer::config::Normalize(config);
    return config;
}

blindxfer::download::ShareLink ResolveLink(const CliArgs& args) {
    const std::string& target = RequirePositional(args, "share link or id");
    if (target.find('#') != std::string::npos) {
        if (!args.key.empty()) {
            throw UsageError("--key cannot be combined with a link that carries a key");
        }
        return blindxfer::download::ParseShareLink(target, args.passphrase);
    }
    if (args.key.empty()) {
        throw UsageError("A key is required: pass a full share link or --key");
    }
    return blindxfer::download::ParseShareLink(target + "#" + args.key, args.passphrase);
}

// Plaintext goes to "<out>.partial" and is renamed only once fully authenticated.
template <typename Writer>
void WriteAtomically(const std::filesystem::path& output, Writer&& writer) {
    std::filesystem::path temp = output;
    temp += ".partial";
    try {
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Failed to open output file: " + temp.string());
            }
            writer(out);
            out.flush();
            if (!out) {
                throw std::runtime_error("Failed to write output file: " + temp.string());
            }
        }
        std::filesystem::rename(temp, output);
    } catch (const std::exception&) {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        throw;
    }
}

int RunKeygen() {
    std::cout << blindxfer::Secret::Generate().ToBase64Url() << "\n";
    return 0;
}

int RunPlan(const CliArgs& args) {
    const std::string& size_text = RequirePositional(args, "size");
    std::uint64_t size = ParseNumber("size", size_text);
    std::uint64_t chunk = args.chunk != 0 ? args.chunk : blindxfer::plan::ChooseChunkSize(size);
    blindxfer::plan::TransferPlan plan = blindxfer::plan::MakePlan(size, chunk);
    std::cout << "total_plaintext_size: " << plan.total_plaintext_size << " bytes\n";
    std::cout << "plain_chunk_size: " << plan.plain_chunk_size << " bytes\n";
    std::cout << "total_parts: " << plan.total_parts << "\n";
    std::cout << "encrypted_size: " << blindxfer::plan::EncryptedSize(plan) << " bytes\n";
    if (plan.total_parts > 0) {
        std::cout << "frame_size: " << blindxfer::plan::FrameSizeOfPart(plan, 0) << " bytes\n";
        std::cout << "last_frame_size: " << blindxfer::plan::FrameSizeOfPart(plan, plan.total_parts - 1)
                  << " bytes\n";
    }
    return 0;
}

int RunUpload(const CliArgs& args) {
    const std::string& input = RequirePositional(args, "input path");
    blindxfer::config::TransferConfig config = MakeConfig(args);
    Backend backend = MakeBackend(args, config);
    if (backend.store) {
        config.share_base = "file://" + std::filesystem::absolute(args.store).string();
    }

    blindxfer::upload::CancellationToken cancel;
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished.load()) {
            if (g_interrupted) {
                cancel.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    blindxfer::progress::ConsoleReporter reporter("Uploading");
    blindxfer::upload::Uploader uploader(backend.Client(), config);
    blindxfer::upload::UploadOutcome outcome;
    try {
        outcome = uploader.UploadFile(input, args.content_type, cancel,
                                      [&reporter](const blindxfer::progress::Snapshot& snapshot) {
                                          reporter.Update(snapshot);
                                      });
    } catch (const std::exception&) {
        finished.store(true);
        watcher.join();
        throw;
    }
    finished.store(true);
    watcher.join();
    reporter.Finish();

    switch (outcome.status) {
        case blindxfer::upload::UploadStatus::kCompleted:
            if (args.passphrase.empty()) {
                std::cout << outcome.share_link << "\n";
            } else {
                blindxfer::Secret key = blindxfer::Secret::FromBase64Url(outcome.key);
                std::cout << config.share_base << "/download/" << outcome.id << "#"
                          << blindxfer::passphrase::WrapKey(key, args.passphrase) << "\n";
            }
            std::cerr << blindxfer::cli::Colorize("Uploaded " + std::to_string(outcome.total_parts) + " parts",
                                                  blindxfer::cli::color::GREEN, stderr)
                      << "\n";
            return 0;
        case blindxfer::upload::UploadStatus::kCancelled:
            std::cerr << blindxfer::cli::Colorize("Upload cancelled", blindxfer::cli::color::YELLOW, stderr) << "\n";
            return 130;
        case blindxfer::upload::UploadStatus::kFailed:
            break;
    }
    throw std::runtime_error(outcome.error.empty() ? "Upload failed" : outcome.error);
}

int RunDownload(const CliArgs& args) {
    blindxfer::download::ShareLink link = ResolveLink(args);
    blindxfer::config::TransferConfig config = MakeConfig(args);
    Backend backend = MakeBackend(args, config);
    blindxfer::download::DownloadSession session(backend.Info(link.id), link.key, backend.Opener(link.id));
    std::string name = blindxfer::download::SanitizeFileName(session.ResolveDisplayName());

    if (args.part) {
        if (*args.part == 0 || *args.part > session.Plan().total_parts) {
            throw UsageError("Part number out of range: " + std::to_string(*args.part));
        }
        std::filesystem::path output =
            args.output.empty() ? name + ".part" + std::to_string(*args.part) : args.output;
        blindxfer::stream::Bytes plain = session.FetchPart(*args.part - 1);
        WriteAtomically(output, [&plain](std::ofstream& out) {
            out.write(reinterpret_cast<const char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
        });
        std::cout << output.string() << "\n";
        return 0;
    }

    std::filesystem::path output = args.output.empty() ? std::filesystem::path(name) : std::filesystem::path(args.output);
    blindxfer::progress::ConsoleReporter reporter("Downloading");
    WriteAtomically(output, [&](std::ofstream& out) {
        session.StreamTo(out, [&reporter](const blindxfer::progress::Snapshot& snapshot) {
            reporter.Update(snapshot);
        });
    });
    reporter.Finish();
    std::cout << output.string() << "\n";
    return 0;
}

int RunProxyServe(const CliArgs& args) {
    if (!args.positional.empty()) {
        throw UsageError("Unexpected argument: " + args.positional.front());
    }
    blindxfer::proxy::ProxyBridge bridge(MakeConfig(args));
    bridge.Start();
    std::cout << bridge.BaseUrl() << "\n" << std::flush;
    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    bridge.Stop();
    return 0;
}

int RunProxyFetch(const CliArgs& args) {
    blindxfer::download::ShareLink link = ResolveLink(args);
    blindxfer::config::TransferConfig config = MakeConfig(args);
    Backend backend = MakeBackend(args, config);
    blindxfer::remote::DownloadInfo info = backend.Info(link.id);
    // Constructing the session validates the persisted plan before the bridge sees it.
    blindxfer::download::DownloadSession session(info, link.key, backend.Opener(link.id));
    std::string name = blindxfer::download::SanitizeFileName(session.ResolveDisplayName());

    blindxfer::io::RangeOpener opener = backend.Opener(link.id);
    blindxfer::proxy::ProxyBridge bridge(config, [opener](const std::string&) { return opener(0, 0); });
    bridge.Start();

    blindxfer::proxy::Registration registration;
    registration.display_name = name;
    registration.size = info.file_size;
    registration.remote_source = backend.ObjectSource(link.id);
    registration.key = link.key.ToBase64Url();
    registration.plain_chunk_size = info.plain_chunk_size;
    std::string url = bridge.Navigate(registration);
    blindxfer::log::Debug("cli", "fetching " + url);

    std::filesystem::path output = args.output.empty() ? std::filesystem::path(name) : std::filesystem::path(args.output);
    WriteAtomically(output, [&](std::ofstream& out) {
        blindxfer::remote::HttpSource source(url, 0, 0, {}, config.http_timeout);
        std::vector<std::uint8_t> buffer(64 * 1024);
        std::size_t n = 0;
        while ((n = source.Read(buffer.data(), buffer.size())) > 0) {
            out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
        }
    });
    bridge.Stop();
    std::cout << output.string() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    for (int i = 2; i < argc; ++i) {
        std::string flag(argv[i]);
        if (flag == "--no-color") {
            blindxfer::cli::SetColorsEnabled(false);
        } else if (flag == "--verbose") {
            blindxfer::log::SetThreshold(blindxfer::log::Level::kDebug);
        }
    }
    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    std::string command(argv[1]);
    try {
        CliArgs args = ParseArgs(argc, argv, 2);
        if (command == "keygen") {
            return RunKeygen();
        }
        if (command == "plan") {
            return RunPlan(args);
        }
        if (command == "upload") {
            return RunUpload(args);
        }
        if (command == "download") {
            return RunDownload(args);
        }
        if (command == "proxy-serve") {
            return RunProxyServe(args);
        }
        if (command == "proxy-fetch") {
            return RunProxyFetch(args);
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << blindxfer::cli::Colorize("Error: ", blindxfer::cli::color::RED, stderr) << exc.what() << "\n";
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << blindxfer::cli::Colorize("Error: ", blindxfer::cli::color::RED, stderr) << exc.what() << "\n";
        return 1;
    }
}
