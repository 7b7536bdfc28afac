/**
 * @file test_packet_router.cpp
 * @brief Tests for PacketRouter forwarding and PacketSent mirroring.
 *
 * Validates:
 *  - Delivery to hops[hop_index] without touching the cursor
 *  - PacketSent carries exactly the forwarded packet, emitted before the send
 *  - Unknown next hop is a logged no-op (NoRoute), not an error
 *  - A dropped neighbor receiver surfaces as LinkDisconnected
 *  - A dead event channel never blocks delivery
 */

#include <gtest/gtest.h>
#include <variant>

#include "dronet/chan/channel.hpp"
#include "dronet/net/events.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/obs/logger.hpp"
#include "dronet/routing/neighbor_table.hpp"
#include "dronet/routing/packet_router.hpp"

using dronet::chan::make_channel;
using dronet::net::NodeEvent;
using dronet::net::Packet;
using dronet::net::PacketSent;
using dronet::net::RoutingHeader;
using dronet::routing::ForwardError;
using dronet::routing::ForwardStatus;
using dronet::routing::NeighborTable;
using dronet::routing::PacketRouter;

namespace {

Packet ack_packet(RoutingHeader h) {
  return Packet{.routing_header = std::move(h), .session_id = 77,
                .payload = dronet::net::Ack{.fragment_index = 2}};
}

} // namespace

/**
 * @test Forward_Delivers_And_MirrorsEvent
 */
TEST(PacketRouter, Forward_Delivers_And_MirrorsEvent) {
  auto [ev_tx, ev_rx] = make_channel<NodeEvent>();
  auto [n3_tx, n3_rx] = make_channel<Packet>();
  dronet::obs::NullLogger log;

  NeighborTable table;
  table.add(3, n3_tx);
  PacketRouter router(2, table, ev_tx, log);

  const auto pkt = ack_packet(RoutingHeader{.hop_index = 2, .hops = {1, 2, 3}});
  auto r = router.forward(pkt);
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, ForwardStatus::Delivered);

  auto got = n3_rx.try_recv();
  ASSERT_TRUE(got);
  EXPECT_EQ(*got, pkt); // cursor untouched

  auto ev = ev_rx.try_recv();
  ASSERT_TRUE(ev);
  ASSERT_TRUE(std::holds_alternative<PacketSent>(*ev));
  EXPECT_EQ(std::get<PacketSent>(*ev).packet, pkt);
  EXPECT_FALSE(ev_rx.try_recv());
}

/**
 * @test Forward_UnknownHop_NoRoute
 * @brief Missing neighbor: nothing sent, no event, status line logged.
 */
TEST(PacketRouter, Forward_UnknownHop_NoRoute) {
  auto [ev_tx, ev_rx] = make_channel<NodeEvent>();
  auto [n3_tx, n3_rx] = make_channel<Packet>();
  dronet::obs::StdioLogger log;
  log.disable();

  NeighborTable table;
  table.add(3, n3_tx);
  PacketRouter router(2, table, ev_tx, log);

  auto r = router.forward(ack_packet(RoutingHeader{.hop_index = 1, .hops = {2, 9}}));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, ForwardStatus::NoRoute);
  EXPECT_TRUE(n3_rx.empty());
  EXPECT_TRUE(ev_rx.empty());
  EXPECT_EQ(log.snapshot().suppressed, 1u);
}

/**
 * @test Forward_InvalidHeader
 */
TEST(PacketRouter, Forward_InvalidHeader) {
  auto [ev_tx, ev_rx] = make_channel<NodeEvent>();
  dronet::obs::NullLogger log;
  NeighborTable table;
  PacketRouter router(2, table, ev_tx, log);

  auto r = router.forward(ack_packet(RoutingHeader{.hop_index = 5, .hops = {1, 2}}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ForwardError::InvalidHeader);
  EXPECT_TRUE(ev_rx.empty());
}

/**
 * @test Forward_ReceiverDropped_LinkDisconnected
 * @brief The attempt is still mirrored to the controller.
 */
TEST(PacketRouter, Forward_ReceiverDropped_LinkDisconnected) {
  auto [ev_tx, ev_rx] = make_channel<NodeEvent>();
  dronet::obs::NullLogger log;
  NeighborTable table;
  {
    auto [n3_tx, n3_rx] = make_channel<Packet>();
    table.add(3, n3_tx);
  } // neighbor 3 is gone

  PacketRouter router(2, table, ev_tx, log);
  auto r = router.forward(ack_packet(RoutingHeader{.hop_index = 1, .hops = {2, 3}}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ForwardError::LinkDisconnected);
  EXPECT_EQ(ev_rx.size(), 1u);
}

/**
 * @test Forward_EventChannelClosed_StillDelivers
 */
TEST(PacketRouter, Forward_EventChannelClosed_StillDelivers) {
  dronet::net::EventSender ev_tx;
  {
    auto [tx, rx] = make_channel<NodeEvent>();
    ev_tx = tx;
  } // controller receiver dropped

  auto [n3_tx, n3_rx] = make_channel<Packet>();
  dronet::obs::StdioLogger log;
  log.disable();
  NeighborTable table;
  table.add(3, n3_tx);
  PacketRouter router(2, table, ev_tx, log);

  auto r = router.forward(ack_packet(RoutingHeader{.hop_index = 1, .hops = {2, 3}}));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, ForwardStatus::Delivered);
  EXPECT_EQ(n3_rx.size(), 1u);
  EXPECT_EQ(log.snapshot().suppressed, 1u); // the failed event emission
}

/**
 * @test Emit_PacketDropped
 */
TEST(PacketRouter, Emit_PacketDropped) {
  auto [ev_tx, ev_rx] = make_channel<NodeEvent>();
  dronet::obs::NullLogger log;
  NeighborTable table;
  PacketRouter router(4, table, ev_tx, log);

  const auto pkt = ack_packet(RoutingHeader{.hop_index = 1, .hops = {4, 5}});
  router.emit(dronet::net::PacketDropped{pkt});
  auto ev = ev_rx.try_recv();
  ASSERT_TRUE(ev);
  ASSERT_TRUE(std::holds_alternative<dronet::net::PacketDropped>(*ev));
  EXPECT_EQ(std::get<dronet::net::PacketDropped>(*ev).packet, pkt);
}
