#pragma once

#include "progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace fetchy {

// Console view over progress snapshots, redrawn in place.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out);
    ~ProgressPanel();

    ProgressPanel(const ProgressPanel&) = delete;
    ProgressPanel& operator=(const ProgressPanel&) = delete;

    // Safe to call from any thread; usable as a ProgressAggregator subscriber.
    void update(const ProgressSnapshot& snapshot);

    void start(std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    // Stops the redraw thread after drawing the latest state once more.
    void stop();
    void render();

    [[nodiscard]] static std::string buildPanel(const std::vector<ProgressSnapshot>& snapshots);
    [[nodiscard]] static std::string formatTaskLine(const ProgressSnapshot& snapshot);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);
    [[nodiscard]] static std::string formatDuration(std::optional<double> seconds);

private:
    void redrawPanel(const std::string& panel);

    std::ostream& out_;

    std::mutex snapshots_mutex_;
    std::vector<std::string> order_;
    std::map<std::string, ProgressSnapshot> snapshots_;

    std::mutex render_mutex_;
    std::size_t previous_lines_{0};

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool running_{false};
    std::thread renderer_;
};

} // namespace fetchy
