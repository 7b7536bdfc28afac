/**
 * @file packet.cpp
 * @brief Naming helpers for packet payloads.
 */
#include "dronet/net/packet.hpp"

namespace dronet::net {

namespace {
struct PayloadName {
    std::string_view operator()(const Fragment&)      const noexcept { return "Fragment"; }
    std::string_view operator()(const Ack&)           const noexcept { return "Ack"; }
    std::string_view operator()(const Nack&)          const noexcept { return "Nack"; }
    std::string_view operator()(const FloodRequest&)  const noexcept { return "FloodRequest"; }
    std::string_view operator()(const FloodResponse&) const noexcept { return "FloodResponse"; }
};
}

std::string_view payload_name(const Payload& p) noexcept {
    if (p.valueless_by_exception()) return "Invalid";
    return std::visit(PayloadName{}, p);
}

std::string_view to_string(NackKind k) noexcept {
    switch (k) {
        case NackKind::ErrorInRouting:      return "ErrorInRouting";
        case NackKind::DestinationIsDrone:  return "DestinationIsDrone";
        case NackKind::Dropped:             return "Dropped";
        case NackKind::UnexpectedRecipient: return "UnexpectedRecipient";
    }
    return "Unknown";
}

bool fragment_index_of(const Payload& p, std::uint64_t& out) noexcept {
    if (const auto* f = std::get_if<Fragment>(&p)) { out = f->fragment_index; return true; }
    if (const auto* a = std::get_if<Ack>(&p))      { out = a->fragment_index; return true; }
    if (const auto* n = std::get_if<Nack>(&p))     { out = n->fragment_index; return true; }
    return false;
}

} // namespace dronet::net
