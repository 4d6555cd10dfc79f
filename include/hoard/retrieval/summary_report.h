#pragma once

#include <hoard/retrieval/orchestrator.h>
#include <hoard/retrieval/progress_store.h>
#include <hoard/retrieval/throughput_tracker.h>

#include <nlohmann/json.hpp>

#include <string>

namespace hoard::retrieval {

// Human-readable end-of-run report
std::string formatSummary(const RunSummary& summary);

// Throughput block shared by the run report and `hoard status`
std::string formatSpeedSummary(const SpeedSummary& speed);

nlohmann::json speedSummaryToJson(const SpeedSummary& speed);
nlohmann::json summaryToJson(const RunSummary& summary);

} // namespace hoard::retrieval
