#include "fetchy/config.hpp"
#include "fetchy/connection_limiter.hpp"
#include "fetchy/detail/curl_utils.hpp"
#include "fetchy/error.hpp"
#include "fetchy/http_client.hpp"
#include "fetchy/logging.hpp"
#include "fetchy/orchestrator.hpp"
#include "fetchy/prober.hpp"
#include "fetchy/progress_panel.hpp"
#include "fetchy/queue_manager.hpp"
#include "fetchy/queue_store.hpp"
#include "fetchy/resume_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

std::atomic<int> g_interrupts{0};

void handleSignal(int) {
    // A second Ctrl+C does not wait for workers to park.
    if (g_interrupts.fetch_add(1) >= 1) {
        std::_Exit(130);
    }
}

// Turns the first SIGINT into a cooperative pause from a normal thread.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void()> on_interrupt) : on_interrupt_(std::move(on_interrupt)) {
        g_interrupts = 0;
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        watcher_ = std::thread([this] {
            while (!done_) {
                if (g_interrupts.load() > 0) {
                    std::cerr << "\nPausing, press Ctrl+C again to quit immediately" << std::endl;
                    on_interrupt_();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~InterruptWatcher() {
        done_ = true;
        if (watcher_.joinable()) {
            watcher_.join();
        }
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::function<void()> on_interrupt_;
    std::atomic<bool> done_{false};
    std::thread watcher_;
};

struct CliOptions {
    std::string command;
    std::vector<std::string> arguments;
    std::optional<std::string> output;
    std::optional<int> threads;
    std::optional<std::filesystem::path> config_path;
    bool quiet{false};
    bool force{false};
    bool verbose{false};
};

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [--config <file>] [-v] <command> [options]\n"
              << "Commands:\n"
              << "  download <url> [-o <file>] [-t <threads>] [-q]   Download now, resuming earlier progress\n"
              << "  add <url> [-o <file>] [-t <threads>]             Append a download to the queue\n"
              << "  drop <url|id>                                    Remove a queue entry and its partial data\n"
              << "  queue                                            List queue entries\n"
              << "  process [-q]                                     Run queued and paused entries\n"
              << "  clear [--force]                                  Remove finished entries (all with --force)\n"
              << "  info <url>                                       Show what the server reports\n"
              << "  cancel <url|id>                                  Cancel an entry and discard its data\n"
              << "  retry <url|id>                                   Queue a failed or cancelled entry again\n"
              << "Options:\n"
              << "  --config <file>  Engine configuration (default: ~/.fetchy/config.json)\n"
              << "  -o <file>        Destination file\n"
              << "  -t <threads>     Connections per download, 1-16\n"
              << "  -q               No progress panel\n"
              << "  -v               Debug logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseThreads(const std::string& text) {
    int threads = 0;
    try {
        threads = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid thread count: " + text);
    }
    if (threads < fetchy::kMinThreads || threads > fetchy::kMaxThreads) {
        throw std::runtime_error(
            fmt::format("Thread count must be between {} and {}", fetchy::kMinThreads, fetchy::kMaxThreads));
    }
    return threads;
}

// False when the command line is unusable; usage has been printed.
bool parseArguments(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            return std::string{argv[++i]};
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--config") {
            const auto path = value();
            if (!path) {
                printUsage(argv[0]);
                return false;
            }
            options.config_path = *path;
        } else if (arg == "-o") {
            options.output = value();
            if (!options.output) {
                printUsage(argv[0]);
                return false;
            }
        } else if (arg == "-t") {
            const auto threads = value();
            if (!threads) {
                printUsage(argv[0]);
                return false;
            }
            options.threads = parseThreads(*threads);
        } else if (arg == "-q") {
            options.quiet = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return false;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.arguments.push_back(arg);
        }
    }

    if (options.command.empty()) {
        printUsage(argv[0]);
        return false;
    }
    return true;
}

const std::string& requireArgument(const CliOptions& options, const char* program_name) {
    if (options.arguments.size() != 1) {
        printUsage(program_name);
        throw std::runtime_error("'" + options.command + "' takes exactly one argument");
    }
    return options.arguments.front();
}

std::string describePercent(const fetchy::DownloadTask& task) {
    if (!task.total_size || *task.total_size == 0) {
        return task.status == fetchy::TaskStatus::Completed ? "100%" : "-";
    }
    const double percent = 100.0 * static_cast<double>(task.downloadedBytes()) / static_cast<double>(*task.total_size);
    return fmt::format("{:.0f}%", percent);
}

void printQueue(const std::vector<fetchy::DownloadTask>& tasks) {
    if (tasks.empty()) {
        std::cout << "Queue is empty" << std::endl;
        return;
    }
    std::size_t position = 0;
    for (const auto& task : tasks) {
        std::cout << fmt::format("{:>3}. {}  {:<11} {:>5}  {}", ++position, task.id, fetchy::toString(task.status),
                                 describePercent(task), task.destination)
                  << '\n'
                  << fmt::format("     {}", task.url) << '\n';
        if (!task.last_error.empty()) {
            std::cout << fmt::format("     error: {}", task.last_error) << '\n';
        }
    }
    std::cout << std::flush;
}

void printProbe(const std::string& url, const fetchy::ProbeResult& probe) {
    std::cout << fmt::format("URL:            {}", url) << '\n'
              << fmt::format("Filename:       {}", probe.suggested_filename.value_or(fetchy::filenameFromUrl(url)))
              << '\n'
              << fmt::format("Size:           {}", probe.total_size
                                                        ? fmt::format("{} ({} bytes)",
                                                                      fetchy::ProgressPanel::formatSize(*probe.total_size),
                                                                      *probe.total_size)
                                                        : std::string{"unknown"})
              << '\n'
              << fmt::format("Content type:   {}", probe.content_type.value_or("unknown")) << '\n'
              << fmt::format("Range requests: {}", probe.accepts_ranges ? "supported" : "not supported") << '\n';
    if (probe.validator && probe.validator->etag) {
        std::cout << fmt::format("ETag:           {}", *probe.validator->etag) << '\n';
    }
    if (probe.validator && probe.validator->last_modified) {
        std::cout << fmt::format("Last-Modified:  {}", *probe.validator->last_modified) << '\n';
    }
    std::cout << std::flush;
}

int exitCodeFor(fetchy::TaskStatus status) {
    switch (status) {
        case fetchy::TaskStatus::Completed: return 0;
        case fetchy::TaskStatus::Paused:    return 130;
        default:                            return 1;
    }
}

struct Engine {
    explicit Engine(fetchy::EngineConfig engine_config)
        : config(std::move(engine_config)),
          http(fetchy::CurlOptions{config.user_agent, config.connect_timeout, config.stall_timeout}),
          limiter(config.max_connections),
          resume_store(config.resumeDir()),
          queue_store(config.queueFile()) {}

    fetchy::EngineConfig config;
    fetchy::CurlHttpClient http;
    fetchy::ConnectionLimiter limiter;
    fetchy::ResumeStore resume_store;
    fetchy::QueueStore queue_store;
};

int runDownload(Engine& engine, const CliOptions& options, const std::string& url) {
    std::string destination;
    if (options.output) {
        destination = *options.output;
    } else {
        fetchy::Prober prober(engine.http, fetchy::RetryPolicy::fromConfig(engine.config));
        const auto probe = prober.probe(url);
        destination = (engine.config.download_dir /
                       probe.suggested_filename.value_or(fetchy::filenameFromUrl(url))).string();
    }
    const int threads = options.threads.value_or(engine.config.default_threads);

    fetchy::ProgressPanel panel(std::cout);
    fetchy::EngineContext context{engine.http, engine.resume_store, engine.limiter, engine.config};
    fetchy::Orchestrator orchestrator(fetchy::makeTask(url, destination, threads), context);

    if (!options.quiet) {
        orchestrator.progress().subscribe([&panel](const fetchy::ProgressSnapshot& snapshot) { panel.update(snapshot); });
        panel.start();
    }

    fetchy::TaskStatus status;
    {
        InterruptWatcher watcher([&orchestrator] { orchestrator.pause(); });
        status = orchestrator.start();
    }
    panel.stop();

    const auto task = orchestrator.snapshot();
    switch (status) {
        case fetchy::TaskStatus::Completed:
            std::cout << fmt::format("Saved {}", task.destination) << std::endl;
            break;
        case fetchy::TaskStatus::Paused:
            std::cout << fmt::format("Paused at {} bytes; run the same command again to resume",
                                     task.downloadedBytes())
                      << std::endl;
            break;
        default:
            std::cerr << fmt::format("Download {}: {}", fetchy::toString(status), task.last_error) << std::endl;
            break;
    }
    return exitCodeFor(status);
}

int runProcess(fetchy::QueueManager& manager, const CliOptions& options) {
    fetchy::ProgressPanel panel(std::cout);
    if (!options.quiet) {
        manager.setProgressSubscriber([&panel](const fetchy::ProgressSnapshot& snapshot) { panel.update(snapshot); });
        panel.start();
    }

    std::size_t ran = 0;
    {
        InterruptWatcher watcher([&manager] { manager.pauseAll(); });
        ran = manager.process();
    }
    panel.stop();
    manager.setProgressSubscriber({});

    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t paused = 0;
    for (const auto& task : manager.list()) {
        completed += task.status == fetchy::TaskStatus::Completed;
        failed += task.status == fetchy::TaskStatus::Failed;
        paused += task.status == fetchy::TaskStatus::Paused;
    }
    std::cout << fmt::format("Processed {} entries: {} completed, {} failed, {} paused", ran, completed, failed,
                             paused)
              << std::endl;
    return failed > 0 ? 1 : 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        CliOptions options;
        if (!parseArguments(argc, argv, options)) {
            return 1;
        }

        const auto config_path =
            options.config_path.value_or(fetchy::defaultConfig().data_dir / "config.json");
        fetchy::EngineConfig config = fetchy::loadConfig(config_path);

        fetchy::Logger::instance().initialize(
            config.log_file, options.verbose ? spdlog::level::debug : fetchy::parseLogLevel(config.log_level));
        fetchy::detail::ensureCurlInitialized();
        FETCHY_DEBUG("fetchy {} on {}", FETCHY_VERSION, fetchy::detail::curlVersion());

        std::error_code ec;
        std::filesystem::create_directories(config.download_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " + config.download_dir.string() +
                                     " - " + ec.message());
        }

        Engine engine(std::move(config));
        const std::string& command = options.command;

        if (command == "download") {
            return runDownload(engine, options, requireArgument(options, argv[0]));
        }
        if (command == "info") {
            const std::string& url = requireArgument(options, argv[0]);
            fetchy::Prober prober(engine.http, fetchy::RetryPolicy::fromConfig(engine.config));
            printProbe(url, prober.probe(url));
            return 0;
        }

        fetchy::QueueManager manager(engine.queue_store, engine.resume_store, engine.http, engine.limiter,
                                     engine.config);

        if (command == "add") {
            fetchy::AddOptions add_options;
            add_options.destination = options.output;
            add_options.threads = options.threads;
            const auto task = manager.add(requireArgument(options, argv[0]), add_options);
            std::cout << fmt::format("Queued {} -> {}", task.id, task.destination) << std::endl;
            return 0;
        }
        if (command == "drop") {
            const std::string& target = requireArgument(options, argv[0]);
            if (!manager.remove(target)) {
                std::cerr << fmt::format("No idle queue entry matches {}", target) << std::endl;
                return 1;
            }
            std::cout << fmt::format("Dropped {}", target) << std::endl;
            return 0;
        }
        if (command == "queue") {
            printQueue(manager.list());
            return 0;
        }
        if (command == "process") {
            return runProcess(manager, options);
        }
        if (command == "clear") {
            std::cout << fmt::format("Removed {} entries", manager.clear(options.force)) << std::endl;
            return 0;
        }
        if (command == "cancel") {
            const std::string& target = requireArgument(options, argv[0]);
            if (!manager.cancel(target)) {
                std::cerr << fmt::format("Cannot cancel {}", target) << std::endl;
                return 1;
            }
            std::cout << fmt::format("Cancelled {}", target) << std::endl;
            return 0;
        }
        if (command == "retry") {
            const std::string& target = requireArgument(options, argv[0]);
            if (!manager.requeue(target)) {
                std::cerr << fmt::format("{} is not failed or cancelled", target) << std::endl;
                return 1;
            }
            std::cout << fmt::format("Requeued {}", target) << std::endl;
            return 0;
        }

        std::cerr << "Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const fetchy::DownloadError& ex) {
        std::cerr << fmt::format("Error ({}): {}", fetchy::toString(ex.kind()), ex.what()) << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
