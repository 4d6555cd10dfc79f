#include <hoard/core/durable_io.h>
#include <hoard/core/time_utils.h>
#include <hoard/retrieval/progress_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace hoard::retrieval {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::uint64_t read_counter(const json& stats, const char* key, const char* legacyKey) {
    for (const char* k : {key, legacyKey}) {
        auto it = stats.find(k);
        if (it != stats.end() && it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it != stats.end() && it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            return static_cast<std::uint64_t>(it->get<std::int64_t>());
        }
    }
    return 0;
}

std::optional<TimePoint> read_time(const json& stats) {
    for (const char* k : {"startTime", "start_time"}) {
        auto it = stats.find(k);
        if (it == stats.end())
            continue;
        if (it->is_string()) {
            auto text = it->get<std::string>();
            // Older files carry local timestamps with fractional seconds
            if (auto dot = text.find('.'); dot != std::string::npos)
                text.resize(dot);
            if (auto tp = time_utils::parseTimestamp(text))
                return tp;
        } else if (it->is_number_integer()) {
            return time_utils::fromEpochSeconds(it->get<std::int64_t>());
        }
    }
    return std::nullopt;
}

ProgressState parse_state(const json& root) {
    ProgressState st;
    for (const char* k : {"completedAssets", "completed_assets"}) {
        if (root.contains(k) && root[k].is_array()) {
            for (const auto& id : root[k]) {
                if (id.is_string())
                    st.completed.insert(id.get<std::string>());
            }
        }
    }
    for (const char* k : {"failedAssets", "failed_assets"}) {
        if (!root.contains(k) || !root[k].is_object())
            continue;
        for (const auto& [id, entry] : root[k].items()) {
            if (st.completed.count(id))
                continue;
            FailureRecord rec;
            if (entry.is_object()) {
                if (entry.contains("reason") && entry["reason"].is_string())
                    rec.reason = entry["reason"].get<std::string>();
                else if (entry.contains("error") && entry["error"].is_string())
                    rec.reason = entry["error"].get<std::string>();
                if (entry.contains("timestamp") && entry["timestamp"].is_string())
                    rec.timestamp = entry["timestamp"].get<std::string>();
            }
            st.failed.emplace(id, std::move(rec));
        }
    }
    if (root.contains("stats") && root["stats"].is_object()) {
        const auto& s = root["stats"];
        st.stats.total = read_counter(s, "total", "total_assets");
        st.stats.alreadyLocal = read_counter(s, "alreadyLocal", "already_local");
        st.stats.downloaded = read_counter(s, "downloaded", "downloaded");
        st.stats.failed = read_counter(s, "failed", "failed");
        st.stats.bytesDownloaded = read_counter(s, "bytesDownloaded", "bytes_downloaded");
        st.stats.startTime = read_time(s);
        for (const char* k : {"lastAssetId", "last_asset_id"}) {
            if (s.contains(k) && s[k].is_string()) {
                st.stats.lastAssetId = s[k].get<std::string>();
                break;
            }
        }
    }
    return st;
}

} // namespace

json runStatsToJson(const RunStats& s) {
    json j{{"total", s.total},
           {"alreadyLocal", s.alreadyLocal},
           {"downloaded", s.downloaded},
           {"failed", s.failed},
           {"bytesDownloaded", s.bytesDownloaded},
           {"startTime", nullptr},
           {"lastAssetId", nullptr}};
    if (s.startTime)
        j["startTime"] = time_utils::formatIsoUtc(*s.startTime);
    if (s.lastAssetId)
        j["lastAssetId"] = *s.lastAssetId;
    return j;
}

ProgressStore::ProgressStore(fs::path path, std::size_t saveEvery)
    : path_(std::move(path)), saveEvery_(saveEvery == 0 ? 1 : saveEvery) {}

ProgressState ProgressStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(path_)) {
        spdlog::debug("No progress file at {}; starting fresh", path_.string());
        return state_;
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::error("Failed to open progress file {} for read; starting fresh", path_.string());
        state_ = ProgressState{};
        tracker_.clear();
        return state_;
    }
    try {
        json root;
        in >> root;
        if (!root.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        state_ = parse_state(root);
        spdlog::info("Resumed progress: {} assets completed, {} failed", state_.completed.size(),
                     state_.failed.size());
        // Unreadable speed history resets only the tracker
        try {
            if (root.contains("speedStats")) {
                tracker_.loadJson(root["speedStats"]);
            } else {
                tracker_.clear();
            }
        } catch (const json::exception& e) {
            spdlog::warn("Discarding unreadable speed history in {}: {}", path_.string(),
                         e.what());
            tracker_.clear();
        }
    } catch (const std::exception& e) {
        spdlog::error("Error loading progress file {}: {}; starting fresh", path_.string(),
                      e.what());
        state_ = ProgressState{};
        tracker_.clear();
    }
    dirtyMarks_ = 0;
    return state_;
}

Result<void> ProgressStore::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

Result<void> ProgressStore::flushIfDue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dirtyMarks_ < saveEvery_) {
        return {};
    }
    return saveLocked();
}

Result<void> ProgressStore::saveLocked() {
    json root;
    root["completedAssets"] = json::array();
    for (const auto& id : state_.completed) {
        root["completedAssets"].push_back(id);
    }
    root["failedAssets"] = json::object();
    for (const auto& [id, rec] : state_.failed) {
        root["failedAssets"][id] = json{{"reason", rec.reason}, {"timestamp", rec.timestamp}};
    }
    root["stats"] = runStatsToJson(state_.stats);
    root["speedStats"] = tracker_.toJson();
    root["savedAt"] = time_utils::nowIsoUtc();

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("Error saving progress: cannot create {}: {}",
                          path_.parent_path().string(), ec.message());
            return Error{ErrorCode::IoError, "create_directories failed: " + ec.message()};
        }
    }

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Error saving progress: cannot open {}", tmp.string());
            return Error{ErrorCode::IoError, "Failed to open progress file for write"};
        }
        out << root.dump(2);
        out.flush();
        if (!out) {
            spdlog::error("Error saving progress: write to {} failed", tmp.string());
            return Error{ErrorCode::IoError, "Failed to write progress file"};
        }
    }
    if (auto r = durable_io::commitStaged(tmp, path_); !r) {
        spdlog::error("Error saving progress to {}: {}", path_.string(), r.error().message);
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        return r.error();
    }
    dirtyMarks_ = 0;
    spdlog::debug("Saved progress to {}", path_.string());
    return {};
}

bool ProgressStore::isProcessed(const AssetId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed.count(id) > 0 || state_.failed.count(id) > 0;
}

bool ProgressStore::isCompleted(const AssetId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed.count(id) > 0;
}

bool ProgressStore::isFailed(const AssetId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.failed.count(id) > 0;
}

void ProgressStore::markCompleted(const AssetId& id, std::uint64_t bytes, double durationSeconds) {
    // Sample and completion change under one lock so every save pairs them
    std::lock_guard<std::mutex> lock(mutex_);
    state_.failed.erase(id);
    state_.stats.lastAssetId = id;
    ++dirtyMarks_;
    if (!state_.completed.insert(id).second) {
        spdlog::debug("{} already marked completed", id);
        return;
    }
    ++state_.stats.downloaded;
    state_.stats.bytesDownloaded += bytes;
    tracker_.recordSample(id, bytes, durationSeconds);
}

void ProgressStore::markFailed(const AssetId& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.completed.count(id)) {
        spdlog::warn("Ignoring failure for {}: already completed ({})", id, reason);
        return;
    }
    state_.failed[id] = FailureRecord{reason, time_utils::nowIsoUtc()};
    ++state_.stats.failed;
    state_.stats.lastAssetId = id;
    ++dirtyMarks_;
}

void ProgressStore::markAlreadyLocal(const AssetId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.failed.erase(id);
    if (state_.completed.insert(id).second) {
        ++state_.stats.alreadyLocal;
        ++dirtyMarks_;
    }
}

bool ProgressStore::unmarkCompleted(const AssetId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.completed.erase(id) == 0) {
        return false;
    }
    ++dirtyMarks_;
    return true;
}

void ProgressStore::setTotal(std::uint64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.stats.total = total;
}

void ProgressStore::ensureStartTime(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.stats.startTime) {
        state_.stats.startTime = now;
    }
}

ProgressState ProgressStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

RunStats ProgressStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.stats;
}

std::size_t ProgressStore::completedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed.size();
}

std::size_t ProgressStore::failedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.failed.size();
}

std::string ProgressStore::elapsedText(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.stats.startTime || now < *state_.stats.startTime) {
        return "00:00:00";
    }
    return time_utils::formatHms(
        std::chrono::duration_cast<std::chrono::seconds>(now - *state_.stats.startTime));
}

Result<void> ProgressStore::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ProgressState{};
    tracker_.clear();
    dirtyMarks_ = 0;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::error("Failed to delete progress file {}: {}", path_.string(), ec.message());
        return Error{ErrorCode::IoError, "Failed to delete progress file: " + ec.message()};
    }
    fs::path tmp = path_;
    tmp += ".tmp";
    fs::remove(tmp, ec);
    return {};
}

} // namespace hoard::retrieval
