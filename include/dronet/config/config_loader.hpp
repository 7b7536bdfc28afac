#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade for per-node configuration (defaults or JSON files).
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * A configuration file holds one JSON object:
 * @code
 * {
 *   "id": 12,                          // 0..255, required
 *   "type": "client",                  // client | drone | server
 *   "server_type": "content",          // content | communication | undefined
 *   "seed": 99,                        // unsigned 64-bit; omit for a random seed
 *   "log": { "enabled": true, "file": "/tmp/node12.log" }
 * }
 * @endcode
 * Comments are not part of the accepted format; they are shown for reference only.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "dronet/compat/expected.hpp"
#include "dronet/net/types.hpp"
#include "dronet/obs/logger.hpp"

namespace dronet::config {

    /** @struct NodeConfig
     *  @brief Everything a node needs besides its channels.
     */
    struct NodeConfig {
        net::NodeId                  id{0};                                 ///< Node identifier
        net::NodeType                type{net::NodeType::Drone};            ///< Role recorded in path traces
        net::ServerType              server_type{net::ServerType::Undefined}; ///< Only meaningful for servers
        std::optional<std::uint64_t> seed;                                  ///< Session-id RNG seed (random if empty)
        obs::LogConfig               log;                                   ///< Logging sink settings
    };

    /** @enum ConfigError
     *  @brief Reasons a configuration file is rejected.
     */
    enum class ConfigError : std::uint8_t {
        FileNotFound = 1,   ///< Path cannot be opened
        ParseError,         ///< Not valid JSON, or the root is not an object
        UnknownKey,         ///< Key not in the accepted set
        InvalidValue,       ///< Value has the wrong JSON type or is out of range
        MissingId           ///< No `id` key
    };

    /** @struct ConfigFailure
     *  @brief Error plus where it was found.
     */
    struct ConfigFailure {
        ConfigError error{ConfigError::InvalidValue};
        std::size_t offset{0};  ///< Byte offset of a JSON syntax error, 0 otherwise
        std::string key;        ///< Offending key ("log.file" for nested keys), empty when not key-specific
    };

    /** @class Loader
     *  @brief Source of node configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Named defaults for a node with the given identity.
        static NodeConfig defaults(net::NodeId id, net::NodeType type);

        /**
         * @brief Parse a configuration file.
         * @param path File path.
         * @return NodeConfig with every unspecified field at its default, or the first failure.
         */
        static dronet_detail::expected<NodeConfig, ConfigFailure> load_from_file(const std::string& path);

        /// Same as load_from_file, from in-memory text.
        static dronet_detail::expected<NodeConfig, ConfigFailure> parse(std::string_view text);
    };

    /// Parse "client" / "drone" / "server" (case-sensitive).
    std::optional<net::NodeType> parse_node_type(std::string_view s) noexcept;

    /// Parse "content" / "communication" / "undefined" (case-sensitive).
    std::optional<net::ServerType> parse_server_type(std::string_view s) noexcept;

    /// Short label for logs.
    std::string_view to_string(ConfigError e) noexcept;

} // namespace dronet::config
