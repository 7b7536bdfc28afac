/**
 * @file message.cpp
 * @brief JSON encoding of client/server application messages.
 */
#include "dronet/net/message.hpp"

#include <array>
#include <limits>
#include <type_traits>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace dronet::net {

namespace {

constexpr std::array<std::string_view, 13> kMessageNames{
    "Default",           "ServerTypeRequest",  "ServerTypeResponse",
    "FileListRequest",   "FileListResponse",   "FileRequest",
    "FileFound",         "RegisterToCommunicationServer",
    "RegisterSuccess",   "ClientListRequest",  "ClientListResponse",
    "Chat",              "ErrorMessage"};
static_assert(kMessageNames.size() == std::variant_size_v<SerializableMessage>);

std::optional<ServerType> server_type_from(std::string_view s) noexcept {
  for (auto t : {ServerType::Content, ServerType::Communication, ServerType::Undefined}) {
    if (to_string(t) == s) return t;
  }
  return std::nullopt;
}

struct Encoder {
  json operator()(const msg::Default&) const { return json::object(); }
  json operator()(const msg::ServerTypeRequest& m) const { return {{"sender", m.sender}}; }
  json operator()(const msg::ServerTypeResponse& m) const {
    return {{"sender", m.sender}, {"server_type", std::string(to_string(m.server_type))}};
  }
  json operator()(const msg::FileListRequest& m) const { return {{"sender", m.sender}}; }
  json operator()(const msg::FileListResponse& m) const {
    return {{"sender", m.sender}, {"files", m.files}};
  }
  json operator()(const msg::FileRequest& m) const {
    return {{"sender", m.sender}, {"filename", m.filename}};
  }
  json operator()(const msg::FileFound& m) const {
    return {{"sender", m.sender}, {"filename", m.filename}, {"content", m.content}};
  }
  json operator()(const msg::RegisterToCommunicationServer& m) const { return {{"sender", m.sender}}; }
  json operator()(const msg::RegisterSuccess& m) const { return {{"sender", m.sender}}; }
  json operator()(const msg::ClientListRequest& m) const { return {{"sender", m.sender}}; }
  json operator()(const msg::ClientListResponse& m) const {
    json ids = json::array();
    for (NodeId c : m.clients) ids.push_back(c);
    return {{"sender", m.sender}, {"clients", std::move(ids)}};
  }
  json operator()(const msg::Chat& m) const {
    return {{"sender", m.sender}, {"server", m.server}, {"recipient", m.recipient}, {"text", m.text}};
  }
  json operator()(const msg::ErrorMessage& m) const {
    return {{"sender", m.sender}, {"text", m.text}};
  }
};

/// Typed field access that records the first failure instead of throwing.
class Fields {
public:
  explicit Fields(const json& j) : j_(j) {}

  std::optional<MessageError> error() const noexcept { return error_; }

  NodeId id(const char* key) {
    const json* v = find(key);
    if (!v) return 0;
    if (!is_node_id(*v)) { fail(MessageError::InvalidValue); return 0; }
    return static_cast<NodeId>(v->get<std::uint64_t>());
  }

  std::string text(const char* key) {
    const json* v = find(key);
    if (!v) return {};
    if (!v->is_string()) { fail(MessageError::InvalidValue); return std::string{}; }
    return v->get<std::string>();
  }

  ServerType server_type(const char* key) {
    const json* v = find(key);
    if (!v) return ServerType::Undefined;
    const auto t = v->is_string() ? server_type_from(v->get_ref<const std::string&>()) : std::nullopt;
    if (!t) { fail(MessageError::InvalidValue); return ServerType::Undefined; }
    return *t;
  }

  std::vector<std::string> texts(const char* key) {
    std::vector<std::string> out;
    const json* v = find(key);
    if (!v) return out;
    if (!v->is_array()) { fail(MessageError::InvalidValue); return out; }
    for (const auto& e : *v) {
      if (!e.is_string()) { fail(MessageError::InvalidValue); return std::vector<std::string>{}; }
      out.push_back(e.get<std::string>());
    }
    return out;
  }

  std::vector<NodeId> ids(const char* key) {
    std::vector<NodeId> out;
    const json* v = find(key);
    if (!v) return out;
    if (!v->is_array()) { fail(MessageError::InvalidValue); return out; }
    for (const auto& e : *v) {
      if (!is_node_id(e)) { fail(MessageError::InvalidValue); return std::vector<NodeId>{}; }
      out.push_back(static_cast<NodeId>(e.get<std::uint64_t>()));
    }
    return out;
  }

private:
  static bool is_node_id(const json& v) {
    return v.is_number_unsigned() && v.get<std::uint64_t>() <= std::numeric_limits<NodeId>::max();
  }

  const json* find(const char* key) {
    if (error_) return nullptr;
    const auto it = j_.find(key);
    if (it == j_.end()) { fail(MessageError::MissingField); return nullptr; }
    return &*it;
  }

  void fail(MessageError e) noexcept {
    if (!error_) error_ = e;
  }

  const json&                 j_;
  std::optional<MessageError> error_;
};

} // namespace

std::string_view message_name(const SerializableMessage& m) noexcept {
  if (m.valueless_by_exception()) return "Invalid";
  return kMessageNames[m.index()];
}

std::optional<NodeId> sender_of(const SerializableMessage& m) noexcept {
  if (m.valueless_by_exception()) return std::nullopt;
  return std::visit([](const auto& alt) -> std::optional<NodeId> {
    if constexpr (std::is_same_v<std::decay_t<decltype(alt)>, msg::Default>) {
      return std::nullopt;
    } else {
      return alt.sender;
    }
  }, m);
}

std::string encode(const SerializableMessage& m) {
  json j = std::visit(Encoder{}, m);
  j["kind"] = std::string(message_name(m));
  return j.dump();
}

dronet_detail::expected<SerializableMessage, MessageError> decode(std::string_view text) {
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error&) {
    return dronet_detail::unexpected(MessageError::ParseError);
  }
  if (!j.is_object()) return dronet_detail::unexpected(MessageError::ParseError);

  const auto kind_it = j.find("kind");
  if (kind_it == j.end() || !kind_it->is_string()) {
    return dronet_detail::unexpected(MessageError::UnknownKind);
  }
  const auto& kind = kind_it->get_ref<const std::string&>();

  Fields f(j);
  SerializableMessage m;
  if (kind == "Default") {
    m = msg::Default{};
  } else if (kind == "ServerTypeRequest") {
    m = msg::ServerTypeRequest{f.id("sender")};
  } else if (kind == "ServerTypeResponse") {
    m = msg::ServerTypeResponse{f.id("sender"), f.server_type("server_type")};
  } else if (kind == "FileListRequest") {
    m = msg::FileListRequest{f.id("sender")};
  } else if (kind == "FileListResponse") {
    m = msg::FileListResponse{f.id("sender"), f.texts("files")};
  } else if (kind == "FileRequest") {
    m = msg::FileRequest{f.id("sender"), f.text("filename")};
  } else if (kind == "FileFound") {
    m = msg::FileFound{f.id("sender"), f.text("filename"), f.text("content")};
  } else if (kind == "RegisterToCommunicationServer") {
    m = msg::RegisterToCommunicationServer{f.id("sender")};
  } else if (kind == "RegisterSuccess") {
    m = msg::RegisterSuccess{f.id("sender")};
  } else if (kind == "ClientListRequest") {
    m = msg::ClientListRequest{f.id("sender")};
  } else if (kind == "ClientListResponse") {
    m = msg::ClientListResponse{f.id("sender"), f.ids("clients")};
  } else if (kind == "Chat") {
    m = msg::Chat{f.id("sender"), f.id("server"), f.id("recipient"), f.text("text")};
  } else if (kind == "ErrorMessage") {
    m = msg::ErrorMessage{f.id("sender"), f.text("text")};
  } else {
    return dronet_detail::unexpected(MessageError::UnknownKind);
  }

  if (const auto e = f.error()) return dronet_detail::unexpected(*e);
  return m;
}

std::string_view to_string(MessageError e) noexcept {
  switch (e) {
    case MessageError::ParseError:   return "parse_error";
    case MessageError::UnknownKind:  return "unknown_kind";
    case MessageError::MissingField: return "missing_field";
    case MessageError::InvalidValue: return "invalid_value";
  }
  return "unknown";
}

} // namespace dronet::net
