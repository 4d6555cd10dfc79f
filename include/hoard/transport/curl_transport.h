#pragma once

#include <hoard/retrieval/retrieval.hpp>
#include <hoard/transport/library_layout.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace hoard::transport {

struct TlsConfig {
    bool insecure{false};
    std::string caPath{};
};

struct CurlTransportOptions {
    TlsConfig tls{};
    std::optional<std::string> proxy{};
    bool followRedirects{true};
    std::string userAgent{"hoard/0.1"};
};

/**
 * HTTP(S) transport over the libcurl easy API.
 *
 * GETs `asset.location` into the layout's staging file, then fsyncs and renames
 * it into place. Any failure (including HTTP status >= 400 and cancellation)
 * removes the staging file and leaves the final path untouched.
 */
class CurlTransport final : public retrieval::ITransportProvider {
public:
    explicit CurlTransport(LibraryLayout layout, CurlTransportOptions options = {});

    Result<std::uint64_t> fetch(const retrieval::Asset& asset, std::chrono::milliseconds timeout,
                                const retrieval::ProgressCallback& onProgress,
                                const retrieval::ShouldCancel& shouldCancel) override;

private:
    LibraryLayout layout_;
    CurlTransportOptions options_;
};

std::unique_ptr<retrieval::ITransportProvider> makeCurlTransport(LibraryLayout layout,
                                                                 CurlTransportOptions options = {});

} // namespace hoard::transport
