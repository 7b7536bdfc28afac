#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "dronet/compat/expected.hpp"
#include "dronet/net/types.hpp"

namespace dronet::net {

/**
 * @file message.hpp
 * @brief Application messages exchanged between clients and servers.
 *
 * A message is encoded to JSON text before it is split into fragments, and
 * decoded once every fragment of a session has arrived. The first field of
 * every message is the id of the node that sent it.
 *
 * Encoded form: one JSON object tagged by `"kind"` (the message_name() of the
 * alternative), e.g.
 * `{"kind":"Chat","sender":1,"server":5,"recipient":2,"text":"hi"}`.
 */
namespace msg {

/// Placeholder carried by a default-constructed message; has no sender.
struct Default final {
  bool operator==(const Default&) const = default;
};

struct ServerTypeRequest final {
  NodeId sender{0};  ///< Client
  bool operator==(const ServerTypeRequest&) const = default;
};

struct ServerTypeResponse final {
  NodeId     sender{0};  ///< Server
  ServerType server_type{ServerType::Undefined};
  bool operator==(const ServerTypeResponse&) const = default;
};

struct FileListRequest final {
  NodeId sender{0};
  bool operator==(const FileListRequest&) const = default;
};

struct FileListResponse final {
  NodeId                   sender{0};
  std::vector<std::string> files;
  bool operator==(const FileListResponse&) const = default;
};

struct FileRequest final {
  NodeId      sender{0};
  std::string filename;
  bool operator==(const FileRequest&) const = default;
};

struct FileFound final {
  NodeId      sender{0};
  std::string filename;
  std::string content;
  bool operator==(const FileFound&) const = default;
};

struct RegisterToCommunicationServer final {
  NodeId sender{0};
  bool operator==(const RegisterToCommunicationServer&) const = default;
};

struct RegisterSuccess final {
  NodeId sender{0};
  bool operator==(const RegisterSuccess&) const = default;
};

struct ClientListRequest final {
  NodeId sender{0};
  bool operator==(const ClientListRequest&) const = default;
};

struct ClientListResponse final {
  NodeId              sender{0};
  std::vector<NodeId> clients;
  bool operator==(const ClientListResponse&) const = default;
};

/// Chat text from client `sender` to client `recipient`, relayed by communication server `server`.
struct Chat final {
  NodeId      sender{0};
  NodeId      server{0};
  NodeId      recipient{0};
  std::string text;
  bool operator==(const Chat&) const = default;
};

struct ErrorMessage final {
  NodeId      sender{0};
  std::string text;
  bool operator==(const ErrorMessage&) const = default;
};

} // namespace msg

using SerializableMessage = std::variant<msg::Default,
                                         msg::ServerTypeRequest,
                                         msg::ServerTypeResponse,
                                         msg::FileListRequest,
                                         msg::FileListResponse,
                                         msg::FileRequest,
                                         msg::FileFound,
                                         msg::RegisterToCommunicationServer,
                                         msg::RegisterSuccess,
                                         msg::ClientListRequest,
                                         msg::ClientListResponse,
                                         msg::Chat,
                                         msg::ErrorMessage>;

/// Reasons decode() rejects a text.
enum class MessageError : std::uint8_t {
  ParseError = 1,   ///< Not JSON, or not an object
  UnknownKind,      ///< `kind` missing or not a message name
  MissingField,     ///< A field of the named kind is absent
  InvalidValue      ///< A field has the wrong JSON type or is out of range
};

/// @brief Alternative name ("Chat", "FileFound", ...), also used as the encoded `kind`.
std::string_view message_name(const SerializableMessage& m) noexcept;

/// @brief Sending node, or empty for msg::Default.
std::optional<NodeId> sender_of(const SerializableMessage& m) noexcept;

/// @brief Compact JSON text of @p m.
std::string encode(const SerializableMessage& m);

/// @brief Inverse of encode(). Unknown extra fields are ignored.
dronet_detail::expected<SerializableMessage, MessageError> decode(std::string_view text);

std::string_view to_string(MessageError e) noexcept;

} // namespace dronet::net
