#include "fetchy/queue_store.hpp"

#include "fetchy/detail/partial_file.hpp"
#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"
#include "fetchy/serialization.hpp"

#include <fstream>
#include <set>
#include <utility>

namespace fetchy {

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace {

constexpr int kQueueVersion = 1;

} // namespace

QueueStore::QueueStore(fs::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }
    if (ec) {
        throw DownloadError(ErrorKind::DiskError,
                            "Cannot create queue directory " + path_.parent_path().string() + ": " + ec.message());
    }
}

std::vector<DownloadTask> QueueStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadTask> tasks;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return tasks;
    }

    std::ifstream in(path_);
    if (!in) {
        throw DownloadError(ErrorKind::DiskError, "Cannot open queue file " + path_.string());
    }

    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& ex) {
        in.close();
        quarantine(ex.what());
        return tasks;
    }

    if (!root.is_object() || !root.contains("downloads") || !root.at("downloads").is_array()) {
        in.close();
        quarantine("missing downloads array");
        return tasks;
    }
    const int version = root.value("version", kQueueVersion);
    if (version != kQueueVersion) {
        FETCHY_WARN("Queue file {} has version {}, reading it as version {}", path_.string(), version,
                    kQueueVersion);
    }

    std::set<std::string> seen;
    std::size_t position = 0;
    for (const auto& entry : root.at("downloads")) {
        ++position;
        try {
            auto task = nlohmann::json(entry).get<DownloadTask>();
            if (!seen.insert(task.id).second) {
                FETCHY_WARN("Dropping duplicate queue entry {} ({})", position, task.id);
                continue;
            }
            tasks.push_back(std::move(task));
        } catch (const nlohmann::json::exception& ex) {
            FETCHY_WARN("Dropping unreadable queue entry {}: {}", position, ex.what());
        } catch (const DownloadError& ex) {
            FETCHY_WARN("Dropping inconsistent queue entry {}: {}", position, ex.what());
        }
    }
    return tasks;
}

void QueueStore::save(const std::vector<DownloadTask>& tasks) {
    json root;
    root["version"] = kQueueVersion;
    root["downloads"] = json::array();
    for (const auto& task : tasks) {
        // to_json is declared for nlohmann::json only.
        root["downloads"].push_back(json(nlohmann::json(task)));
    }
    const std::string content = root.dump(2);

    std::lock_guard<std::mutex> lock(mutex_);
    detail::writeFileAtomically(path_, content);
}

void QueueStore::quarantine(const std::string& reason) {
    const fs::path aside = path_.string() + ".corrupt";
    FETCHY_WARN("Queue file {} is corrupt ({}), moving it to {}", path_.string(), reason, aside.string());
    std::error_code ec;
    fs::rename(path_, aside, ec);
    if (ec) {
        FETCHY_ERROR("Cannot move corrupt queue file aside: {}", ec.message());
    }
}

} // namespace fetchy
