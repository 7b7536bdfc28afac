#pragma once
/**
 * @file logger.hpp
 * @brief Injected logging capability for nodes: status/error lines + counters.
 * @details Each node receives a Logger at construction instead of consulting a
 *          process-wide flag. Enable/disable and file redirection are
 *          configuration of the concrete sink.
 */

#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "dronet/config/constants.hpp"
#include "dronet/net/types.hpp"

namespace dronet::obs {

    /** @struct Counters
     *  @brief Lines written by a logger since construction.
     */
    struct Counters {
        uint64_t status_lines{0};  ///< Status lines written
        uint64_t error_lines{0};   ///< Error lines written
        uint64_t suppressed{0};    ///< Lines dropped while disabled
    };

    /** @struct LogConfig
     *  @brief Logging configuration of a node.
     */
    struct LogConfig {
        bool        enabled{dronet::config::constants::LOG_ENABLED_DEFAULT}; ///< Start enabled
        std::string file;                                                     ///< Append here instead of stdout/stderr (empty = console)
    };

    /** @class Logger
     *  @brief Logging sink interface. Implementations must be thread-safe:
     *         every node thread of a simulation may share one instance.
     */
    class Logger {
    public:
        virtual ~Logger() = default;
        /// Record a status line for @p node.
        virtual void status(net::NodeId node, std::string_view message) = 0;
        /// Record an error line for @p node.
        virtual void error(net::NodeId node, std::string_view message) = 0;
        /// Whether lines are currently written.
        virtual bool enabled() const = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /** @class StdioLogger
     *  @brief stdio-backed sink: `[NODE id] msg` on stdout, `[NODE id] Error: msg`
     *         on stderr, or both appended to a file after redirect_to_file().
     */
    class StdioLogger final : public Logger {
    public:
        /// Opens `cfg.file` when set. If it cannot be opened the sink stays on the
        /// console and reports the failure as an error line.
        explicit StdioLogger(const LogConfig& cfg = {});

        void status(net::NodeId node, std::string_view message) override;
        void error(net::NodeId node, std::string_view message) override;
        bool enabled() const override;
        Counters snapshot() const override;

        void enable();
        void disable();

        /// Append every following line to @p path. Returns false if the file cannot be opened
        /// (the previous destination stays in place).
        bool redirect_to_file(const std::string& path);

        /// Go back to stdout/stderr.
        void redirect_to_console();

        /// Current destination file, empty when writing to the console.
        std::string file() const;

    private:
        struct FileCloser { void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); } };

        void write(std::FILE* console, net::NodeId node, std::string_view prefix,
                   std::string_view message, uint64_t Counters::*counter);

        mutable std::mutex mu_;
        bool enabled_{true};
        std::unique_ptr<std::FILE, FileCloser> file_;
        std::string path_;
        Counters ctr_;
    };

    /** @class NullLogger
     *  @brief Discards every line (counts them as suppressed).
     */
    class NullLogger final : public Logger {
    public:
        void status(net::NodeId, std::string_view) override;
        void error(net::NodeId, std::string_view) override;
        bool enabled() const override { return false; }
        Counters snapshot() const override;
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    /// Build the sink described by @p cfg. Falls back to the console if the file cannot be opened.
    std::shared_ptr<StdioLogger> make_logger(const LogConfig& cfg);

    /// Process-wide silent sink for callers that do not care about diagnostics.
    std::shared_ptr<Logger> null_logger();

} // namespace dronet::obs
