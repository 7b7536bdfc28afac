/**
 * @file test_channel.cpp
 * @brief Tests for the MPSC channel (Sender clones, Receiver ownership, disconnects).
 */
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "dronet/chan/channel.hpp"

using namespace std::chrono_literals;
using dronet::chan::ChannelError;
using dronet::chan::make_channel;
using dronet::chan::Receiver;
using dronet::chan::Sender;

TEST(Channel, Fifo_SingleProducer) {
  auto [tx, rx] = make_channel<int>();
  for (int i = 0; i < 5; ++i) ASSERT_TRUE(tx.send(i));
  EXPECT_EQ(rx.size(), 5u);

  std::vector<int> out;
  while (auto v = rx.try_recv()) out.push_back(*v);
  EXPECT_EQ(out, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(Channel, TryRecv_Empty_Vs_Disconnected) {
  auto [tx, rx] = make_channel<int>();
  auto e = rx.try_recv();
  ASSERT_FALSE(e);
  EXPECT_EQ(e.error(), ChannelError::Empty);

  ASSERT_TRUE(tx.send(1));
  { Sender<int> gone = std::move(tx); } // last sender dropped

  auto v = rx.try_recv();
  ASSERT_TRUE(v); // queued item still drains
  EXPECT_EQ(*v, 1);
  auto d = rx.try_recv();
  ASSERT_FALSE(d);
  EXPECT_EQ(d.error(), ChannelError::Disconnected);
}

/**
 * @test Send_AfterReceiverDropped
 */
TEST(Channel, Send_AfterReceiverDropped) {
  Sender<int> tx;
  {
    auto [s, r] = make_channel<int>();
    tx = s;
    EXPECT_TRUE(tx.connected());
  }
  EXPECT_FALSE(tx.connected());
  auto r = tx.send(3);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ChannelError::Disconnected);
}

TEST(Channel, Detached_Handles) {
  Sender<int> tx;
  Receiver<int> rx;
  EXPECT_FALSE(tx.connected());
  EXPECT_EQ(tx.send(1).error(), ChannelError::Disconnected);
  EXPECT_EQ(rx.try_recv().error(), ChannelError::Disconnected);
  EXPECT_EQ(rx.recv_for(1ms).error(), ChannelError::Disconnected);
  EXPECT_TRUE(rx.empty());
}

TEST(Channel, RecvFor_Timeout) {
  auto [tx, rx] = make_channel<int>();
  auto r = rx.recv_for(2ms);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ChannelError::Timeout);
}

/**
 * @test Clones_ShareReceiver
 * @brief Every clone feeds the same queue; the channel stays connected until the last one goes.
 */
TEST(Channel, Clones_ShareReceiver) {
  auto [tx, rx] = make_channel<int>();
  Sender<int> a = tx;
  Sender<int> b = a;
  EXPECT_TRUE(a.same_channel(b));
  ASSERT_TRUE(a.send(1));
  ASSERT_TRUE(b.send(2));
  { Sender<int> drop = std::move(tx); }
  { Sender<int> drop = std::move(a); }
  ASSERT_TRUE(b.send(3));
  EXPECT_EQ(rx.size(), 3u);

  auto [other_tx, other_rx] = make_channel<int>();
  EXPECT_FALSE(b.same_channel(other_tx));
}

/**
 * @test MoveOnly_Payload
 */
TEST(Channel, MoveOnly_Payload) {
  auto [tx, rx] = make_channel<std::unique_ptr<int>>();
  ASSERT_TRUE(tx.send(std::make_unique<int>(41)));
  auto v = rx.try_recv();
  ASSERT_TRUE(v);
  ASSERT_TRUE(*v);
  EXPECT_EQ(**v, 41);
}

TEST(Channel, MultiProducer_Concurrent) {
  constexpr int P = 4;
  constexpr int N = 10000;
  auto [tx, rx] = make_channel<int>();

  std::vector<std::thread> producers;
  for (int p = 0; p < P; ++p) {
    producers.emplace_back([link = tx] {
      for (int i = 0; i < N; ++i) ASSERT_TRUE(link.send(i));
    });
  }
  { Sender<int> drop = std::move(tx); } // only the producers' clones remain

  long long sum = 0;
  int count = 0;
  while (auto v = rx.recv()) {
    sum += *v;
    ++count;
  }
  for (auto& t : producers) t.join();

  EXPECT_EQ(count, P * N);
  EXPECT_EQ(sum, static_cast<long long>(P) * N * (N - 1) / 2);
}
