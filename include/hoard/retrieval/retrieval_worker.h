#pragma once

#include <hoard/retrieval/retrieval.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

namespace hoard::retrieval {

struct FetchReport {
    bool success{false};
    std::uint64_t bytesTransferred{0};
    double durationSeconds{0.0};
    std::optional<Error> error;
};

/**
 * One timed transfer attempt. The deadline is enforced cooperatively through
 * the ShouldCancel handed to the transport.
 */
class RetrievalWorker {
public:
    explicit RetrievalWorker(ITransportProvider& transport, ProgressCallback onProgress = {});

    FetchReport fetch(const Asset& asset, std::chrono::milliseconds timeout) const;

private:
    ITransportProvider& transport_;
    ProgressCallback onProgress_;
};

} // namespace hoard::retrieval
