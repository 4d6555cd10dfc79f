/*
 * curl_transport.cpp
 *
 * Notes
 * - One GET per asset with the libcurl easy API; no ranges or resume of partial bodies.
 * - Honors timeout, TLS verify/CA, proxy and redirects.
 * - Cancellation is cooperative: the write and progress callbacks poll ShouldCancel.
 */

#include <hoard/core/durable_io.h>
#include <hoard/transport/curl_transport.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <system_error>

namespace hoard::transport {

namespace fs = std::filesystem;

namespace {

std::once_flag curlInitFlag;

void ensure_curl_initialized() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

struct WriteContext {
    std::ofstream* out{nullptr};
    const retrieval::ProgressCallback* onProgress{nullptr};
    const retrieval::ShouldCancel* shouldCancel{nullptr};
    const retrieval::AssetId* assetId{nullptr};
    std::uint64_t downloaded{0};
    bool cancelRequested{false};
    bool writeFailed{false};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    ctx->out->write(ptr, static_cast<std::streamsize>(total));
    if (!*ctx->out) {
        ctx->writeFailed = true;
        return 0;
    }
    ctx->downloaded += static_cast<std::uint64_t>(total);
    return total;
}

// Reports progress and lets a stalled transfer observe cancellation
int xferinfo_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    if (ctx->onProgress && *ctx->onProgress && dlnow > 0) {
        retrieval::TransferProgress ev;
        ev.assetId = *ctx->assetId;
        ev.bytesSoFar = static_cast<std::uint64_t>(dlnow);
        if (dltotal > 0) {
            ev.fraction = static_cast<double>(dlnow) / static_cast<double>(dltotal);
        }
        (*ctx->onProgress)(ev);
    }
    return 0;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, std::chrono::milliseconds timeout,
                      const CurlTransportOptions& options) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(static_cast<long>(timeout.count()), 30000)));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

void remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        spdlog::debug("Could not remove {}: {}", p.string(), ec.message());
    }
}

} // namespace

CurlTransport::CurlTransport(LibraryLayout layout, CurlTransportOptions options)
    : layout_(std::move(layout)), options_(std::move(options)) {
    ensure_curl_initialized();
}

Result<std::uint64_t> CurlTransport::fetch(const retrieval::Asset& asset,
                                           std::chrono::milliseconds timeout,
                                           const retrieval::ProgressCallback& onProgress,
                                           const retrieval::ShouldCancel& shouldCancel) {
    if (asset.location.empty()) {
        return Error{ErrorCode::InvalidArgument, "Asset " + asset.id + " has no location"};
    }

    const auto finalPath = layout_.finalPath(asset);
    const auto staging = layout_.stagingPath(asset);
    std::error_code ec;
    fs::create_directories(finalPath.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "create_directories failed for " + finalPath.parent_path().string() + ": " +
                         ec.message()};
    }

    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open staging file " + staging.string()};
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.close();
        remove_quietly(staging);
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    WriteContext wctx;
    wctx.out = &out;
    wctx.onProgress = &onProgress;
    wctx.shouldCancel = &shouldCancel;
    wctx.assetId = &asset.id;

    curl_easy_setopt(curl, CURLOPT_URL, asset.location.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    configure_common(curl, timeout, options_);

    spdlog::debug("GET {} -> {}", asset.location, staging.string());
    CURLcode rc = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    curl_easy_cleanup(curl);
    out.close();

    if (wctx.cancelRequested) {
        remove_quietly(staging);
        return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
    }
    if (wctx.writeFailed) {
        remove_quietly(staging);
        return Error{ErrorCode::IoError, "Failed writing " + staging.string()};
    }
    if (rc != CURLE_OK) {
        remove_quietly(staging);
        return makeCurlError(rc, "fetch(GET)");
    }
    if (http_status >= 400) {
        remove_quietly(staging);
        return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(http_status)};
    }
    if (!out) {
        remove_quietly(staging);
        return Error{ErrorCode::IoError, "Failed to close staging file " + staging.string()};
    }

    if (auto r = durable_io::commitStaged(staging, finalPath); !r) {
        remove_quietly(staging);
        return r.error();
    }
    spdlog::debug("Stored {} ({} bytes)", finalPath.string(), wctx.downloaded);
    return wctx.downloaded;
}

std::unique_ptr<retrieval::ITransportProvider> makeCurlTransport(LibraryLayout layout,
                                                                 CurlTransportOptions options) {
    return std::make_unique<CurlTransport>(std::move(layout), std::move(options));
}

} // namespace hoard::transport
