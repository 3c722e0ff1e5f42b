#include "fetchy/resume_store.hpp"

#include "fetchy/detail/partial_file.hpp"
#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"
#include "fetchy/serialization.hpp"

#include <fstream>
#include <utility>

namespace fetchy {

namespace fs = std::filesystem;

ResumeStore::ResumeStore(fs::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw DownloadError(ErrorKind::DiskError,
                            "Cannot create resume directory " + directory_.string() + ": " + ec.message());
    }
}

void ResumeStore::save(const ResumeRecord& record) {
    const std::string content = nlohmann::json(record).dump(2);

    std::lock_guard<std::mutex> lock(mutex_);
    detail::writeFileAtomically(pathFor(record.id), content);
}

std::optional<ResumeRecord> ResumeStore::load(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path path = pathFor(id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    auto record = read(path);
    if (record && record->id != id) {
        FETCHY_WARN("Resume record {} names task {}, ignoring it", path.string(), record->id);
        return std::nullopt;
    }
    return record;
}

void ResumeStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(pathFor(id), ec);
    if (ec) {
        FETCHY_WARN("Cannot remove resume record for {}: {}", id, ec.message());
    }
}

std::vector<ResumeRecord> ResumeStore::loadAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResumeRecord> records;

    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() != ".json") {
            continue;
        }
        if (auto record = read(it->path())) {
            records.push_back(std::move(*record));
        }
    }
    if (ec) {
        FETCHY_WARN("Cannot list resume directory {}: {}", directory_.string(), ec.message());
    }
    return records;
}

std::size_t ResumeStore::pruneOrphans() {
    std::size_t pruned = 0;
    for (const auto& record : loadAll()) {
        std::error_code ec;
        if (fs::exists(record.partialPath(), ec)) {
            continue;
        }
        FETCHY_INFO("Pruning resume record {}: {} is gone", record.id, record.partialPath());
        remove(record.id);
        ++pruned;
    }
    return pruned;
}

fs::path ResumeStore::pathFor(const std::string& id) const {
    return directory_ / (id + ".json");
}

std::optional<ResumeRecord> ResumeStore::read(const fs::path& path) const {
    std::ifstream in(path);
    if (!in) {
        FETCHY_WARN("Cannot open resume record {}", path.string());
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(in).get<ResumeRecord>();
    } catch (const nlohmann::json::exception& ex) {
        FETCHY_WARN("Unreadable resume record {}: {}", path.string(), ex.what());
    } catch (const DownloadError& ex) {
        FETCHY_WARN("Inconsistent resume record {}: {}", path.string(), ex.what());
    }
    return std::nullopt;
}

} // namespace fetchy
