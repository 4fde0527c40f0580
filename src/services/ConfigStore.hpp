/**
 * @file ConfigStore.hpp
 * @brief Holds the active configuration and hot-swaps it on reload
 */

#pragma once

#include "models/Config.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

/**
 * @class ConfigStore
 * @brief Owner of the active Config snapshot
 *
 * Readers call current() and keep the returned pointer for as long as they
 * need a consistent view; a reload publishes a new snapshot and never
 * mutates the old one. A reload that fails to parse or validate is
 * rejected in full and the previous snapshot stays active.
 */
class ConfigStore {
public:
    using Listener = std::function<void(const std::shared_ptr<const Config>&)>;

    static constexpr std::chrono::seconds DEFAULT_RELOAD_INTERVAL{30};

    explicit ConfigStore(std::filesystem::path path);
    ~ConfigStore();

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /**
     * @brief $XDG_CONFIG_HOME/drivewatch/drivewatch.conf
     */
    [[nodiscard]] static auto default_path() -> std::filesystem::path;

    /**
     * @brief Parse and validate INI text
     */
    [[nodiscard]] static auto parse(std::string_view text) -> util::Result<Config>;

    /**
     * @brief Render a Config as INI text that parse() accepts
     */
    [[nodiscard]] static auto serialize(const Config& config) -> std::string;

    /**
     * @brief Initial load
     *
     * A missing file activates the defaults and writes them out (best
     * effort). A malformed file keeps the defaults active and is reported.
     */
    auto load() -> util::Result<void>;

    /**
     * @brief Re-read the file
     * @return true if a new snapshot was published, false if the file is
     *         unchanged; ConfigInvalid if it was rejected
     */
    auto reload() -> util::Result<bool>;

    /**
     * @brief Validate and publish a programmatic replacement
     */
    auto replace(Config config) -> util::Result<void>;

    [[nodiscard]] auto current() const -> std::shared_ptr<const Config>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Called (outside the store lock) with each newly published snapshot
     */
    void subscribe(Listener listener);

    /**
     * @brief Start the background reload timer
     */
    void start_reload_timer(std::chrono::milliseconds interval = DEFAULT_RELOAD_INTERVAL);
    void stop_reload_timer();

private:
    void publish(std::shared_ptr<const Config> config);
    void reload_loop(std::chrono::milliseconds interval);

    std::filesystem::path path_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Config> current_;
    std::string last_content_;
    std::vector<Listener> listeners_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool stop_requested_ = false;
    std::thread timer_thread_;
};
