/**
* @file config_loader.cpp
 * @brief Loader for JSON node configuration files.
 */
#include "dronet/config/config_loader.hpp"
#include "dronet/config/constants.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace dronet::config {

    namespace {

        dronet_detail::unexpected<ConfigFailure> fail(ConfigError e, std::string key = {},
                                                      std::size_t offset = 0) {
            return dronet_detail::unexpected(ConfigFailure{e, offset, std::move(key)});
        }

        /// Apply the "log" sub-object onto @p log.
        dronet_detail::expected<void, ConfigFailure> read_log(const json& j, obs::LogConfig& log) {
            if (!j.is_object()) return fail(ConfigError::InvalidValue, "log");
            for (const auto& [key, value] : j.items()) {
                if (key == "enabled") {
                    if (!value.is_boolean()) return fail(ConfigError::InvalidValue, "log.enabled");
                    log.enabled = value.get<bool>();
                } else if (key == "file") {
                    if (!value.is_string()) return fail(ConfigError::InvalidValue, "log.file");
                    log.file = value.get<std::string>();
                } else {
                    return fail(ConfigError::UnknownKey, "log." + key);
                }
            }
            return {};
        }

    } // namespace

    std::optional<net::NodeType> parse_node_type(std::string_view s) noexcept {
        if (s == "client") return net::NodeType::Client;
        if (s == "drone")  return net::NodeType::Drone;
        if (s == "server") return net::NodeType::Server;
        return std::nullopt;
    }

    std::optional<net::ServerType> parse_server_type(std::string_view s) noexcept {
        if (s == "content")       return net::ServerType::Content;
        if (s == "communication") return net::ServerType::Communication;
        if (s == "undefined")     return net::ServerType::Undefined;
        return std::nullopt;
    }

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::UnknownKey:   return "unknown_key";
            case ConfigError::InvalidValue: return "invalid_value";
            case ConfigError::MissingId:    return "missing_id";
        }
        return "unknown";
    }

    NodeConfig Loader::defaults(net::NodeId id, net::NodeType type) {
        NodeConfig cfg;
        cfg.id   = id;
        cfg.type = type;
        cfg.log  = obs::LogConfig{}; // enabled per LOG_ENABLED_DEFAULT, console
        return cfg;
    }

    dronet_detail::expected<NodeConfig, ConfigFailure> Loader::parse(std::string_view text) {
        json root;
        try {
            root = json::parse(text.begin(), text.end());
        } catch (const json::parse_error& e) {
            return fail(ConfigError::ParseError, {}, e.byte);
        }
        if (!root.is_object()) return fail(ConfigError::ParseError);

        NodeConfig cfg = defaults(0, net::NodeType::Drone);
        bool have_id = false;

        for (const auto& [key, value] : root.items()) {
            if (key == "id") {
                if (!value.is_number_unsigned() ||
                    value.get<std::uint64_t>() > std::numeric_limits<net::NodeId>::max()) {
                    return fail(ConfigError::InvalidValue, key);
                }
                cfg.id  = static_cast<net::NodeId>(value.get<std::uint64_t>());
                have_id = true;
            } else if (key == "type") {
                const auto t = value.is_string() ? parse_node_type(value.get_ref<const std::string&>())
                                                 : std::nullopt;
                if (!t) return fail(ConfigError::InvalidValue, key);
                cfg.type = *t;
            } else if (key == "server_type") {
                const auto t = value.is_string() ? parse_server_type(value.get_ref<const std::string&>())
                                                 : std::nullopt;
                if (!t) return fail(ConfigError::InvalidValue, key);
                cfg.server_type = *t;
            } else if (key == "seed") {
                if (!value.is_number_unsigned()) return fail(ConfigError::InvalidValue, key);
                cfg.seed = value.get<std::uint64_t>();
            } else if (key == "log") {
                if (auto r = read_log(value, cfg.log); !r) return dronet_detail::unexpected(r.error());
            } else {
                return fail(ConfigError::UnknownKey, key);
            }
        }

        if (!have_id) return fail(ConfigError::MissingId, "id");
        return cfg;
    }

    dronet_detail::expected<NodeConfig, ConfigFailure> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return fail(ConfigError::FileNotFound);
        std::ostringstream buf;
        buf << in.rdbuf();
        return parse(buf.str());
    }

} // namespace dronet::config
