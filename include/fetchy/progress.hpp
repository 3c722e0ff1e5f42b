#pragma once

#include "download_task.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fetchy {

struct ProgressSnapshot {
    std::string task_id;
    std::string filename;
    TaskStatus status{TaskStatus::Queued};
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t downloaded_bytes{0};
    double bytes_per_second{0.0};
    std::optional<double> eta_seconds;
    std::optional<double> percent;
    std::string error_message;
};

} // namespace fetchy
