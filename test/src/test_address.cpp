#include <stdexcept>

#include <gtest/gtest.h>

#include <tuic/model/address.hpp>

using tuic::model::Address;

TEST(Address, ParseDomain) {
  auto addr = Address::parse("example.com:443");
  EXPECT_EQ(addr.type(), Address::Type::Domain);
  EXPECT_EQ(addr.host(), "example.com");
  EXPECT_EQ(addr.port(), 443);
  EXPECT_EQ(addr.encoded_len(), 1 + 1 + 11 + 2);
  EXPECT_EQ(addr.to_string(), "example.com:443");
}

TEST(Address, ParseIpv4) {
  auto addr = Address::parse("10.0.0.1:53");
  EXPECT_EQ(addr.type(), Address::Type::Ipv4);
  EXPECT_EQ(addr.ip(), boost::asio::ip::make_address("10.0.0.1"));
  EXPECT_EQ(addr.port(), 53);
  EXPECT_EQ(addr.encoded_len(), 7u);
}

TEST(Address, ParseIpv6) {
  auto addr = Address::parse("[::1]:8080");
  EXPECT_EQ(addr.type(), Address::Type::Ipv6);
  EXPECT_EQ(addr.port(), 8080);
  EXPECT_EQ(addr.encoded_len(), 19u);
  EXPECT_EQ(addr.to_string(), "[::1]:8080");
}

TEST(Address, ParseRejectsMalformed) {
  EXPECT_THROW(Address::parse(""), std::invalid_argument);
  EXPECT_THROW(Address::parse("example.com"), std::invalid_argument);
  EXPECT_THROW(Address::parse("example.com:http"), std::invalid_argument);
  EXPECT_THROW(Address::parse("example.com:70000"), std::invalid_argument);
  EXPECT_THROW(Address::parse("[::1:53"), std::invalid_argument);
  EXPECT_THROW(Address::parse("[not-an-ip]:53"), std::invalid_argument);
}

TEST(Address, DomainLengthLimits) {
  EXPECT_NO_THROW(Address::domain(std::string(255, 'a'), 1));
  EXPECT_THROW(Address::domain(std::string(256, 'a'), 1), std::invalid_argument);
  EXPECT_THROW(Address::domain("", 1), std::invalid_argument);
}

TEST(Address, NoneAndEquality) {
  Address none;
  EXPECT_TRUE(none.is_none());
  EXPECT_EQ(none.encoded_len(), 1u);
  EXPECT_EQ(none.to_string(), "none");

  EXPECT_EQ(Address::parse("1.2.3.4:5"),
            Address::socket(boost::asio::ip::make_address("1.2.3.4"), 5));
  EXPECT_NE(Address::parse("1.2.3.4:5"), Address::parse("1.2.3.4:6"));
  EXPECT_NE(Address::domain("a", 1), none);
}

TEST(Address, FormatsLikeToString) {
  EXPECT_EQ(fmt::format("{}", Address::parse("example.com:443")),
            "example.com:443");
  EXPECT_EQ(fmt::format("{}", Address::parse("[::1]:8080")), "[::1]:8080");
  EXPECT_EQ(fmt::format("to {:>8}", Address{}), "to     none");
}
