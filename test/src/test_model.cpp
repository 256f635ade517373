#include <algorithm>
#include <numeric>
#include <random>

#include <gtest/gtest.h>

#include <tuic/model/connection.hpp>

using namespace tuic;
using namespace tuic::model;

static Bytes make_payload(std::size_t size) {
  Bytes payload(size);
  std::iota(payload.begin(), payload.end(), std::uint8_t{0});
  return payload;
}

// Feeds the fragments of one packet through the receiving model and
// returns whatever completed.
static std::optional<Assembled> deliver(const Connection& rx,
                                        const std::vector<Fragment>& frags,
                                        std::vector<std::size_t> order) {
  std::optional<Assembled> result;
  for (auto i : order) {
    auto pkt = rx.recv_packet_unrestricted(frags[i].header);
    auto done = pkt.assemble(frags[i].data);
    if (done) {
      EXPECT_FALSE(result) << "packet completed twice";
      result = std::move(done);
    }
  }
  return result;
}

TEST(PacketTx, SingleFragment) {
  Connection tx;
  auto payload = make_payload(100);
  auto frags = tx.send_packet(7, Address::parse("1.2.3.4:53"), 1200)
                   .fragments(payload);
  ASSERT_EQ(frags.size(), 1u);
  EXPECT_EQ(frags[0].header.frag_total, 1);
  EXPECT_EQ(frags[0].header.size, 100);
  EXPECT_EQ(frags[0].header.addr.to_string(), "1.2.3.4:53");
}

TEST(PacketTx, EmptyPayload) {
  Connection tx;
  auto frags = tx.send_packet(1, Address::parse("1.2.3.4:53"), 1200)
                   .fragments({});
  ASSERT_EQ(frags.size(), 1u);
  EXPECT_EQ(frags[0].header.size, 0);
  EXPECT_TRUE(frags[0].data.empty());
}

TEST(PacketTx, FragmentSizes) {
  Connection tx;
  auto payload = make_payload(3000);
  // 17 byte first header, 11 byte header on the others
  auto frags = tx.send_packet(7, Address::parse("1.2.3.4:53"), 1200)
                   .fragments(payload);
  ASSERT_EQ(frags.size(), 3u);

  std::size_t total = 0;
  for (std::size_t i = 0; i < frags.size(); ++i) {
    const auto& h = frags[i].header;
    EXPECT_EQ(h.frag_total, 3);
    EXPECT_EQ(h.frag_id, i);
    EXPECT_EQ(h.size, frags[i].data.size());
    EXPECT_LE(header_len(h) + frags[i].data.size(), 1200u);
    EXPECT_EQ(h.addr.is_none(), i != 0);
    total += h.size;
  }
  EXPECT_EQ(frags[0].data.size(), 1183u);
  EXPECT_EQ(frags[1].data.size(), 1189u);
  EXPECT_EQ(total, payload.size());
}

TEST(PacketTx, PacketIdsAdvancePerAssociation) {
  Connection tx;
  auto addr = Address::parse("1.2.3.4:53");
  EXPECT_EQ(tx.send_packet(1, addr, 1200).pkt_id(), 0);
  EXPECT_EQ(tx.send_packet(1, addr, 1200).pkt_id(), 1);
  EXPECT_EQ(tx.send_packet(2, addr, 1200).pkt_id(), 0);
  EXPECT_EQ(tx.task_associate_count(), 2u);
}

TEST(PacketTx, RejectsImpossibleSizes) {
  Connection tx;
  auto addr = Address::parse("1.2.3.4:53");
  Bytes payload(10);
  EXPECT_THROW(tx.send_packet(1, addr, 17).fragments(payload), Exception);

  // 255 fragments of one byte each is the limit
  Address none;
  auto at_limit = make_payload(255);
  EXPECT_EQ(tx.send_packet(2, none, 12).fragments(at_limit).size(), 255u);
  auto over = make_payload(256);
  EXPECT_THROW(tx.send_packet(2, none, 12).fragments(over), Exception);
}

TEST(PacketRx, ReassemblesInAnyOrder) {
  Connection tx;
  auto payload = make_payload(5000);
  auto frags = tx.send_packet(9, Address::domain("example.org", 5353), 1200)
                   .fragments(payload);
  ASSERT_EQ(frags.size(), 5u);

  std::vector<std::size_t> order(frags.size());
  std::iota(order.begin(), order.end(), 0);
  std::mt19937 rng(42);

  for (int round = 0; round < 10; ++round) {
    std::shuffle(order.begin(), order.end(), rng);
    Connection rx;
    auto done = deliver(rx, frags, order);
    ASSERT_TRUE(done);
    EXPECT_EQ(done->payload, payload);
    EXPECT_EQ(done->addr.to_string(), "example.org:5353");
    EXPECT_EQ(done->assoc_id, 9);
    // the buffer is released once complete
    EXPECT_EQ(rx.collect_garbage(std::chrono::seconds(0)), 0u);
  }
}

TEST(PacketRx, DuplicateFragment) {
  Connection tx;
  auto payload = make_payload(3000);
  auto frags = tx.send_packet(1, Address::parse("1.2.3.4:53"), 1200)
                   .fragments(payload);

  Connection rx;
  EXPECT_FALSE(rx.recv_packet_unrestricted(frags[1].header)
                   .assemble(frags[1].data));
  try {
    rx.recv_packet_unrestricted(frags[1].header).assemble(frags[1].data);
    FAIL() << "duplicate accepted";
  } catch (const AssembleError& e) {
    EXPECT_EQ(e.reason(), AssembleError::Reason::DuplicatedFragment);
    EXPECT_EQ(e.kind(), ErrorKind::Assemble);
  }
}

TEST(PacketRx, InvalidFragments) {
  Connection rx;
  header::Packet h;
  h.assoc_id = 1;
  h.frag_total = 2;
  h.frag_id = 2;
  h.size = 1;
  Bytes one{0x01};

  try {
    rx.recv_packet_unrestricted(h).assemble(one);
    FAIL();
  } catch (const AssembleError& e) {
    EXPECT_EQ(e.reason(), AssembleError::Reason::InvalidFragmentId);
  }

  h.frag_id = 0;
  try {
    rx.recv_packet_unrestricted(h).assemble(Bytes{0x01, 0x02});
    FAIL();
  } catch (const AssembleError& e) {
    EXPECT_EQ(e.reason(), AssembleError::Reason::SizeMismatch);
  }

  EXPECT_FALSE(rx.recv_packet_unrestricted(h).assemble(one));
  h.frag_total = 3;
  h.frag_id = 1;
  try {
    rx.recv_packet_unrestricted(h).assemble(one);
    FAIL();
  } catch (const AssembleError& e) {
    EXPECT_EQ(e.reason(), AssembleError::Reason::FragmentTotalMismatch);
  }
}

TEST(PacketRx, GarbageCollection) {
  Connection tx;
  auto payload = make_payload(3000);
  auto frags = tx.send_packet(4, Address::parse("1.2.3.4:53"), 1200)
                   .fragments(payload);

  Connection rx;
  EXPECT_FALSE(rx.recv_packet_unrestricted(frags[0].header)
                   .assemble(frags[0].data));

  EXPECT_EQ(rx.collect_garbage(std::chrono::hours(1)), 0u);
  EXPECT_EQ(rx.collect_garbage(std::chrono::seconds(0)), 1u);
  // association survives collection
  EXPECT_EQ(rx.task_associate_count(), 1u);

  // a late fragment starts a fresh buffer
  EXPECT_FALSE(rx.recv_packet_unrestricted(frags[1].header)
                   .assemble(frags[1].data));
  EXPECT_FALSE(rx.recv_packet_unrestricted(frags[2].header)
                   .assemble(frags[2].data));
}

TEST(Connection, RestrictedReceiveNeedsAssociation) {
  Connection client;
  header::Packet h;
  h.assoc_id = 3;
  EXPECT_FALSE(client.recv_packet(h));

  client.send_packet(3, Address::parse("1.2.3.4:53"), 1200);
  EXPECT_TRUE(client.recv_packet(h));
}

TEST(Connection, DissociateDropsSessionAndBuffers) {
  Connection tx;
  auto payload = make_payload(3000);
  auto frags = tx.send_packet(5, Address::parse("1.2.3.4:53"), 1200)
                   .fragments(payload);

  Connection rx;
  auto first = rx.recv_packet_unrestricted(frags[0].header);
  auto second = rx.recv_packet_unrestricted(frags[1].header);
  EXPECT_FALSE(first.assemble(frags[0].data));
  EXPECT_EQ(rx.task_associate_count(), 1u);

  EXPECT_EQ(rx.recv_dissociate(header::Dissociate{5}), 5);
  EXPECT_EQ(rx.task_associate_count(), 0u);
  EXPECT_EQ(rx.collect_garbage(std::chrono::seconds(0)), 0u);

  EXPECT_THROW(second.assemble(frags[1].data), ExceptionInvalidUdpSession);

  tx.send_dissociate(5);
  EXPECT_EQ(tx.task_associate_count(), 0u);
}

TEST(Connection, ConnectCount) {
  Connection conn;
  EXPECT_EQ(conn.task_connect_count(), 0u);
  {
    auto a = conn.send_connect(Address::parse("example.com:443"));
    auto b = conn.recv_connect(header::Connect{Address::parse("1.1.1.1:80")});
    EXPECT_EQ(conn.task_connect_count(), 2u);
    EXPECT_EQ(std::get<header::Connect>(a.header()).addr.port(), 443);

    auto moved = std::move(a);
    EXPECT_EQ(conn.task_connect_count(), 2u);
  }
  EXPECT_EQ(conn.task_connect_count(), 0u);
}
