#pragma once

#include "download_task.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fetchy {

// Durable task id -> ResumeRecord map, one JSON file per task. Every write
// goes through a temporary file and a rename, so a crash leaves either the
// old record or the new one.
class ResumeStore {
public:
    explicit ResumeStore(std::filesystem::path directory);

    void save(const ResumeRecord& record);
    [[nodiscard]] std::optional<ResumeRecord> load(const std::string& id) const;
    void remove(const std::string& id);

    // Every readable record; unreadable files are skipped with a warning.
    [[nodiscard]] std::vector<ResumeRecord> loadAll() const;

    // Drops records whose partial file has disappeared. Returns how many.
    std::size_t pruneOrphans();

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path pathFor(const std::string& id) const;
    [[nodiscard]] std::optional<ResumeRecord> read(const std::filesystem::path& path) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace fetchy
