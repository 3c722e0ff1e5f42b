#include "fetchy/progress_panel.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace fetchy {

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

ProgressPanel::~ProgressPanel() {
    stop();
}

void ProgressPanel::update(const ProgressSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(snapshots_mutex_);
    if (snapshots_.find(snapshot.task_id) == snapshots_.end()) {
        order_.push_back(snapshot.task_id);
    }
    snapshots_[snapshot.task_id] = snapshot;
}

void ProgressPanel::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    renderer_ = std::thread([this, interval] {
        std::unique_lock<std::mutex> run_lock(run_mutex_);
        while (!run_cv_.wait_for(run_lock, interval, [this] { return !running_; })) {
            run_lock.unlock();
            render();
            run_lock.lock();
        }
    });
}

void ProgressPanel::stop() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    run_cv_.notify_all();
    if (renderer_.joinable()) {
        renderer_.join();
    }
    render();
    out_ << std::flush;
}

void ProgressPanel::render() {
    std::vector<ProgressSnapshot> snapshots;
    {
        std::lock_guard<std::mutex> lock(snapshots_mutex_);
        snapshots.reserve(order_.size());
        for (const auto& id : order_) {
            snapshots.push_back(snapshots_.at(id));
        }
    }
    if (snapshots.empty()) {
        return;
    }
    redrawPanel(buildPanel(snapshots));
}

std::string ProgressPanel::buildPanel(const std::vector<ProgressSnapshot>& snapshots) {
    std::string panel;
    panel.reserve(snapshots.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("fetchy ({} tasks)\n", snapshots.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    bool all_sized = true;
    double rate_all = 0.0;

    for (const auto& snapshot : snapshots) {
        panel += formatTaskLine(snapshot);
        panel.push_back('\n');

        if (snapshot.total_bytes) {
            total_all += *snapshot.total_bytes;
        } else {
            all_sized = false;
        }
        downloaded_all += snapshot.downloaded_bytes;
        if (snapshot.status == TaskStatus::Downloading) {
            rate_all += snapshot.bytes_per_second;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (all_sized && total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%  {}/s", static_cast<int>(ratio * 100.0),
                             formatSize(static_cast<std::uint64_t>(rate_all)));
    } else {
        panel += fmt::format("Overall: {}  {}/s", formatSize(downloaded_all),
                             formatSize(static_cast<std::uint64_t>(rate_all)));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatTaskLine(const ProgressSnapshot& snapshot) {
    std::string line;
    line.reserve(256);

    std::string display_name = snapshot.filename;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (snapshot.percent) {
        const double ratio = std::clamp(*snapshot.percent / 100.0, 0.0, 1.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, static_cast<int>(ratio * 100.0),
                            formatSize(snapshot.downloaded_bytes), formatSize(*snapshot.total_bytes));
    } else {
        line += fmt::format("{:<20} [{:^30}] ({})", display_name, "size unknown",
                            formatSize(snapshot.downloaded_bytes));
    }

    switch (snapshot.status) {
        case TaskStatus::Downloading:
            line += fmt::format("  {}/s  ETA {}", formatSize(static_cast<std::uint64_t>(snapshot.bytes_per_second)),
                                formatDuration(snapshot.eta_seconds));
            break;
        case TaskStatus::Failed:
            line += fmt::format("  failed: {}", snapshot.error_message);
            break;
        case TaskStatus::Completed:
            line.append("  done");
            break;
        default:
            line += fmt::format("  {}", toString(snapshot.status));
            break;
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string ProgressPanel::formatDuration(std::optional<double> seconds) {
    if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0) {
        return "--:--";
    }
    const auto total = static_cast<std::uint64_t>(std::llround(*seconds));
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto secs = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return fmt::format("{:02}:{:02}", minutes, secs);
}

void ProgressPanel::redrawPanel(const std::string& panel) {
    std::lock_guard<std::mutex> lock(render_mutex_);
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace fetchy
