#include <hoard/retrieval/retrieval_worker.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace hoard::retrieval {

RetrievalWorker::RetrievalWorker(ITransportProvider& transport, ProgressCallback onProgress)
    : transport_(transport), onProgress_(std::move(onProgress)) {}

FetchReport RetrievalWorker::fetch(const Asset& asset, std::chrono::milliseconds timeout) const {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    const auto deadline = start + timeout;
    const ShouldCancel pastDeadline = [deadline] { return clock::now() >= deadline; };
    const double timeoutSeconds = std::chrono::duration<double>(timeout).count();

    FetchReport report;
    Result<std::uint64_t> result{ErrorCode::Unknown};
    try {
        result = transport_.fetch(asset, timeout, onProgress_, pastDeadline);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, std::string("transport threw: ") + e.what()};
    } catch (...) {
        result = Error{ErrorCode::InternalError, "transport threw a non-standard exception"};
    }
    const auto elapsed = clock::now() - start;

    // A transfer that only completes past the deadline still counts as timed out
    if (elapsed >= timeout) {
        report.durationSeconds = timeoutSeconds;
        report.error = Error{ErrorCode::Timeout,
                             "transfer timed out after " + std::to_string(timeout.count()) + " ms"};
        spdlog::debug("Fetch of {} timed out", asset.id);
        return report;
    }

    report.durationSeconds = std::chrono::duration<double>(elapsed).count();
    if (!result) {
        report.error = result.error();
        spdlog::debug("Fetch of {} failed: {}", asset.id, result.error().message);
        return report;
    }
    report.success = true;
    report.bytesTransferred = result.value();
    return report;
}

} // namespace hoard::retrieval
