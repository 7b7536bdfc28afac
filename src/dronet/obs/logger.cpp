/**
* @file logger.cpp
 * @brief printf-backed Logger implementations.
 */
#include "dronet/obs/logger.hpp"

namespace dronet::obs {

    StdioLogger::StdioLogger(const LogConfig& cfg) : enabled_(cfg.enabled) {
        if (!cfg.file.empty() && !redirect_to_file(cfg.file)) {
            // Node 0 stands for the logger itself; the line goes to the console sink.
            error(0, "Cannot open log file " + cfg.file + ", logging to console");
        }
    }

    void StdioLogger::write(std::FILE* console, net::NodeId node, std::string_view prefix,
                            std::string_view message, uint64_t Counters::*counter) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!enabled_) { ctr_.suppressed++; return; }
        std::FILE* out = file_ ? file_.get() : console;
        std::fprintf(out, "[NODE %u] %.*s%.*s\n",
                     static_cast<unsigned>(node),
                     static_cast<int>(prefix.size()), prefix.data(),
                     static_cast<int>(message.size()), message.data());
        std::fflush(out);
        ctr_.*counter += 1;
    }

    void StdioLogger::status(net::NodeId node, std::string_view message) {
        write(stdout, node, "", message, &Counters::status_lines);
    }

    void StdioLogger::error(net::NodeId node, std::string_view message) {
        write(stderr, node, "Error: ", message, &Counters::error_lines);
    }

    bool StdioLogger::enabled() const {
        std::lock_guard<std::mutex> lk(mu_);
        return enabled_;
    }

    Counters StdioLogger::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    void StdioLogger::enable() {
        std::lock_guard<std::mutex> lk(mu_);
        enabled_ = true;
    }

    void StdioLogger::disable() {
        std::lock_guard<std::mutex> lk(mu_);
        enabled_ = false;
    }

    bool StdioLogger::redirect_to_file(const std::string& path) {
        std::unique_ptr<std::FILE, FileCloser> f(std::fopen(path.c_str(), "a"));
        if (!f) return false;
        std::lock_guard<std::mutex> lk(mu_);
        file_ = std::move(f);
        path_ = path;
        return true;
    }

    void StdioLogger::redirect_to_console() {
        std::lock_guard<std::mutex> lk(mu_);
        file_.reset();
        path_.clear();
    }

    std::string StdioLogger::file() const {
        std::lock_guard<std::mutex> lk(mu_);
        return path_;
    }

    void NullLogger::status(net::NodeId, std::string_view) {
        std::lock_guard<std::mutex> lk(mu_);
        ctr_.suppressed++;
    }

    void NullLogger::error(net::NodeId, std::string_view) {
        std::lock_guard<std::mutex> lk(mu_);
        ctr_.suppressed++;
    }

    Counters NullLogger::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    std::shared_ptr<StdioLogger> make_logger(const LogConfig& cfg) {
        return std::make_shared<StdioLogger>(cfg);
    }

    std::shared_ptr<Logger> null_logger() {
        static const auto sink = std::make_shared<NullLogger>(); // process-wide singleton
        return sink;
    }

} // namespace dronet::obs
