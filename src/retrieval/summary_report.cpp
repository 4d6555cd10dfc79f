#include <hoard/retrieval/summary_report.h>

#include <fmt/format.h>

#include <iterator>

namespace hoard::retrieval {

using json = nlohmann::json;

namespace {

std::string shortId(const AssetId& id) {
    return id.size() > 8 ? id.substr(0, 8) + "..." : id;
}

double percent(std::size_t part, std::size_t whole) {
    return whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

json extremeToJson(const std::optional<SpeedExtreme>& e) {
    if (!e)
        return nullptr;
    return json{{"assetId", e->assetId}, {"speedMBps", e->speedMBps}, {"sizeMB", e->sizeMB}};
}

} // namespace

std::string formatSpeedSummary(const SpeedSummary& s) {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "Download speed statistics\n");
    fmt::format_to(it, "  Overall average speed: {:.2f} MB/s\n", s.overallAvgMBps);
    fmt::format_to(it, "  Per-download average:  {:.2f} MB/s\n", s.avgMBps);
    fmt::format_to(it, "  Median speed:          {:.2f} MB/s\n", s.medianMBps);
    fmt::format_to(it, "  Speed range:           {:.2f} - {:.2f} MB/s\n", s.minMBps, s.maxMBps);
    if (s.count > 3) {
        fmt::format_to(it, "  25th/75th percentile:  {:.2f} / {:.2f} MB/s\n", s.p25MBps,
                       s.p75MBps);
    }
    fmt::format_to(it, "  Average file size:     {:.1f} MB\n", s.avgSizeMB);
    fmt::format_to(it, "  Average download time: {:.1f} seconds\n", s.avgDurationSeconds);
    fmt::format_to(it, "  Total transfer time:   {:.2f} hours\n", s.totalSeconds / 3600.0);
    if (s.fastest) {
        fmt::format_to(it, "  Fastest download:      {:.1f} MB/s ({:.1f} MB, {})\n",
                       s.fastest->speedMBps, s.fastest->sizeMB, shortId(s.fastest->assetId));
    }
    if (s.slowest) {
        fmt::format_to(it, "  Slowest download:      {:.1f} MB/s ({:.1f} MB, {})\n",
                       s.slowest->speedMBps, s.slowest->sizeMB, shortId(s.slowest->assetId));
    }
    const auto& d = s.distribution;
    fmt::format_to(it, "  Speed distribution:\n");
    fmt::format_to(it, "    < 1 MB/s:   {} ({:.1f}%)\n", d.below1, percent(d.below1, s.count));
    fmt::format_to(it, "    1-5 MB/s:   {} ({:.1f}%)\n", d.from1To5, percent(d.from1To5, s.count));
    fmt::format_to(it, "    5-10 MB/s:  {} ({:.1f}%)\n", d.from5To10,
                   percent(d.from5To10, s.count));
    fmt::format_to(it, "    >= 10 MB/s: {} ({:.1f}%)\n", d.atLeast10,
                   percent(d.atLeast10, s.count));
    return out;
}

std::string formatSummary(const RunSummary& r) {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "{}\n", std::string(40, '='));
    fmt::format_to(it, "{}\n", r.dryRun ? "DRY RUN SUMMARY" : "RETRIEVAL SUMMARY");
    fmt::format_to(it, "{}\n", std::string(40, '='));
    fmt::format_to(it, "Mode: {}\n", toString(r.mode));
    fmt::format_to(it, "Considered this run: {}\n", r.considered);
    fmt::format_to(it, "Previously processed: {}\n", r.alreadyProcessed);
    fmt::format_to(it, "Already local: {}\n", r.alreadyLocal);

    if (r.dryRun) {
        fmt::format_to(it, "Would download: {}\n", r.wouldFetch.size());
        for (const auto& id : r.wouldFetch) {
            fmt::format_to(it, "  {}\n", id);
        }
        return out;
    }

    fmt::format_to(it, "Downloaded this run: {} ({:.2f} GB)\n", r.schedule.completed,
                   static_cast<double>(r.schedule.bytes) / BYTES_PER_GB);
    fmt::format_to(it, "Failed this run: {}\n", r.schedule.failed);
    if (r.verified > 0 || r.unverified > 0) {
        fmt::format_to(it, "Final verification: {} verified, {} still missing\n", r.verified,
                       r.unverified);
    }
    if (r.halt != HaltReason::None) {
        fmt::format_to(it, "Stopped early: {}\n", toString(r.halt));
    }

    fmt::format_to(it, "\nTotals across runs\n");
    fmt::format_to(it, "  Catalog size: {}\n", r.stats.total);
    fmt::format_to(it, "  Completed: {}\n", r.completedTotal);
    fmt::format_to(it, "  Failed: {}\n", r.failedTotal);
    fmt::format_to(it, "  Already had originals: {}\n", r.stats.alreadyLocal);
    fmt::format_to(it, "  Data downloaded: {:.2f} GB\n",
                   static_cast<double>(r.stats.bytesDownloaded) / BYTES_PER_GB);
    fmt::format_to(it, "  Elapsed: {}\n", r.elapsed);
    if (r.freeSpaceGB) {
        fmt::format_to(it, "  Free space: {:.1f} GB\n", *r.freeSpaceGB);
    }
    if (r.speed) {
        fmt::format_to(it, "\n{}", formatSpeedSummary(*r.speed));
    }
    return out;
}

json speedSummaryToJson(const SpeedSummary& s) {
    return json{{"count", s.count},
                {"avgMBps", s.avgMBps},
                {"medianMBps", s.medianMBps},
                {"minMBps", s.minMBps},
                {"maxMBps", s.maxMBps},
                {"p25MBps", s.p25MBps},
                {"p75MBps", s.p75MBps},
                {"overallAvgMBps", s.overallAvgMBps},
                {"totalBytes", s.totalBytes},
                {"totalSeconds", s.totalSeconds},
                {"avgSizeMB", s.avgSizeMB},
                {"avgDurationSeconds", s.avgDurationSeconds},
                {"fastest", extremeToJson(s.fastest)},
                {"slowest", extremeToJson(s.slowest)},
                {"distribution",
                 {{"below1", s.distribution.below1},
                  {"from1To5", s.distribution.from1To5},
                  {"from5To10", s.distribution.from5To10},
                  {"atLeast10", s.distribution.atLeast10}}}};
}

json summaryToJson(const RunSummary& r) {
    json j{{"mode", toString(r.mode)},
           {"dryRun", r.dryRun},
           {"considered", r.considered},
           {"alreadyProcessed", r.alreadyProcessed},
           {"alreadyLocal", r.alreadyLocal},
           {"queued", r.queued},
           {"downloaded", r.schedule.completed},
           {"failed", r.schedule.failed},
           {"skipped", r.schedule.skipped},
           {"stopped", r.schedule.stopped},
           {"bytes", r.schedule.bytes},
           {"verified", r.verified},
           {"unverified", r.unverified},
           {"halt", toString(r.halt)},
           {"completedTotal", r.completedTotal},
           {"failedTotal", r.failedTotal},
           {"elapsed", r.elapsed},
           {"stats", runStatsToJson(r.stats)},
           {"speed", nullptr},
           {"freeSpaceGB", nullptr}};
    if (r.dryRun)
        j["wouldFetch"] = r.wouldFetch;
    if (r.speed)
        j["speed"] = speedSummaryToJson(*r.speed);
    if (r.freeSpaceGB)
        j["freeSpaceGB"] = *r.freeSpaceGB;
    return j;
}

} // namespace hoard::retrieval
