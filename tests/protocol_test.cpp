#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <boost/cstdint.hpp>

#include "protocol.h"
#include "socks_error.h"

using namespace nanosocks;

namespace
{

std::vector<boost::uint8_t> bytes(std::initializer_list<boost::uint8_t> list)
{
	return std::vector<boost::uint8_t>(list);
}

}    // namespace

TEST(ProtocolTest, DecodeGreeting)
{
	const auto data = bytes({0x05, 0x02, 0x02, 0x00});
	socks5::greeting g;
	boost::system::error_code ec;
	const std::size_t consumed = socks5::decode_greeting(data.data(), data.size(), g, ec);
	ASSERT_FALSE(ec);
	EXPECT_EQ(consumed, 4u);
	ASSERT_EQ(g.methods.size(), 2u);
	EXPECT_EQ(g.methods[0], socks5::method_username_password);
	EXPECT_EQ(g.methods[1], socks5::method_no_auth);
}

TEST(ProtocolTest, DecodeGreetingDoesNotOverRead)
{
	const auto data = bytes({0x05, 0x01, 0x00, 0x05, 0x01, 0x00, 0x01});
	socks5::greeting g;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_greeting(data.data(), data.size(), g, ec), 3u);
	ASSERT_FALSE(ec);
	EXPECT_EQ(g.methods.size(), 1u);
}

TEST(ProtocolTest, GreetingWithBadVersion)
{
	const auto data = bytes({0x04, 0x01, 0x00});
	socks5::greeting g;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_greeting(data.data(), data.size(), g, ec), 0u);
	EXPECT_EQ(ec, error::malformed_greeting);

	socks5::greeting_length(data.data(), 1, ec);
	EXPECT_EQ(ec, error::malformed_greeting);
}

TEST(ProtocolTest, GreetingShorterThanMethodCount)
{
	const auto data = bytes({0x05, 0x03, 0x00, 0x01});
	socks5::greeting g;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_greeting(data.data(), data.size(), g, ec), 0u);
	EXPECT_EQ(ec, error::malformed_greeting);
}

TEST(ProtocolTest, GreetingSurvivesEncodeAndDecode)
{
	socks5::greeting g;
	g.methods.push_back(socks5::method_no_auth);
	g.methods.push_back(socks5::method_username_password);
	const std::vector<boost::uint8_t> data = socks5::encode_greeting(g);
	EXPECT_EQ(data, bytes({0x05, 0x02, 0x00, 0x02}));

	socks5::greeting decoded;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_greeting(data.data(), data.size(), decoded, ec), data.size());
	ASSERT_FALSE(ec);
	EXPECT_EQ(decoded.methods, g.methods);

	g.methods.assign(256, socks5::method_no_auth);
	EXPECT_THROW(socks5::encode_greeting(g), std::length_error);
}

TEST(ProtocolTest, GreetingLength)
{
	const auto data = bytes({0x05, 0x03});
	boost::system::error_code ec;
	EXPECT_EQ(socks5::greeting_length(data.data(), 0, ec), 0u);
	EXPECT_FALSE(ec);
	EXPECT_EQ(socks5::greeting_length(data.data(), 1, ec), 0u);
	EXPECT_FALSE(ec);
	EXPECT_EQ(socks5::greeting_length(data.data(), 2, ec), 5u);
	EXPECT_FALSE(ec);
}

TEST(ProtocolTest, MethodSelection)
{
	EXPECT_EQ(socks5::encode_method_selection(socks5::method_no_auth), bytes({0x05, 0x00}));

	const auto data = bytes({0x05, 0xff});
	boost::uint8_t method = 0;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_method_selection(data.data(), data.size(), method, ec), 2u);
	ASSERT_FALSE(ec);
	EXPECT_EQ(method, socks5::method_no_acceptable);
}

TEST(ProtocolTest, DecodeIpv4Request)
{
	const auto data = bytes({0x05, 0x01, 0x00, 0x01, 0x5D, 0xB8, 0xD8, 0x22, 0x00, 0x50});
	socks5::request r;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_request(data.data(), data.size(), r, ec), data.size());
	ASSERT_FALSE(ec);
	EXPECT_EQ(r.command, socks5::command_connect);
	EXPECT_EQ(r.destination.type, socks5::address_ipv4);
	EXPECT_EQ(r.destination.ipv4.to_string(), "93.184.216.34");
	EXPECT_EQ(r.destination.port, 80);
}

TEST(ProtocolTest, DecodeDomainRequest)
{
	auto data = bytes({0x05, 0x01, 0x00, 0x03, 11});
	const std::string host = "example.com";
	data.insert(data.end(), host.begin(), host.end());
	data.push_back(0x01);
	data.push_back(0xBB);

	socks5::request r;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_request(data.data(), data.size(), r, ec), data.size());
	ASSERT_FALSE(ec);
	EXPECT_EQ(r.destination.type, socks5::address_domain);
	EXPECT_EQ(r.destination.domain, host);
	EXPECT_EQ(r.destination.port, 443);
}

TEST(ProtocolTest, DecodeIpv6Request)
{
	auto data = bytes({0x05, 0x01, 0x00, 0x04});
	data.insert(data.end(), 15, 0x00);
	data.push_back(0x01);
	data.push_back(0x1F);
	data.push_back(0x90);

	socks5::request r;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_request(data.data(), data.size(), r, ec), 22u);
	ASSERT_FALSE(ec);
	EXPECT_EQ(r.destination.type, socks5::address_ipv6);
	EXPECT_TRUE(r.destination.ipv6.is_loopback());
	EXPECT_EQ(r.destination.port, 8080);
}

TEST(ProtocolTest, RequestLength)
{
	const auto ipv4 = bytes({0x05, 0x01, 0x00, 0x01});
	const auto domain = bytes({0x05, 0x01, 0x00, 0x03, 0x04});
	boost::system::error_code ec;

	EXPECT_EQ(socks5::request_length(ipv4.data(), 3, ec), 0u);
	EXPECT_FALSE(ec);
	EXPECT_EQ(socks5::request_length(ipv4.data(), 4, ec), 10u);
	EXPECT_FALSE(ec);
	EXPECT_EQ(socks5::request_length(domain.data(), 4, ec), 0u);
	EXPECT_FALSE(ec);
	EXPECT_EQ(socks5::request_length(domain.data(), 5, ec), 11u);
	EXPECT_FALSE(ec);
}

TEST(ProtocolTest, MalformedRequests)
{
	boost::system::error_code ec;

	const auto bad_version = bytes({0x04, 0x01, 0x00, 0x01});
	socks5::request_length(bad_version.data(), bad_version.size(), ec);
	EXPECT_EQ(ec, error::malformed_request);

	const auto bad_reserved = bytes({0x05, 0x01, 0x07, 0x01});
	socks5::request_length(bad_reserved.data(), bad_reserved.size(), ec);
	EXPECT_EQ(ec, error::malformed_request);

	const auto bad_type = bytes({0x05, 0x01, 0x00, 0x02});
	socks5::request_length(bad_type.data(), bad_type.size(), ec);
	EXPECT_EQ(ec, error::malformed_request);

	const auto truncated = bytes({0x05, 0x01, 0x00, 0x01, 0x7F, 0x00, 0x00, 0x01, 0x00});
	socks5::request r;
	EXPECT_EQ(socks5::decode_request(truncated.data(), truncated.size(), r, ec), 0u);
	EXPECT_EQ(ec, error::malformed_request);
}

TEST(ProtocolTest, RequestSurvivesEncodeAndDecode)
{
	socks5::request original;
	original.command = socks5::command_bind;
	original.destination.type = socks5::address_domain;
	original.destination.domain = "proxy.example.org";
	original.destination.port = 65535;

	const auto data = socks5::encode_request(original);
	socks5::request decoded;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_request(data.data(), data.size(), decoded, ec), data.size());
	ASSERT_FALSE(ec);
	EXPECT_EQ(decoded.command, original.command);
	EXPECT_EQ(decoded.destination.type, original.destination.type);
	EXPECT_EQ(decoded.destination.domain, original.destination.domain);
	EXPECT_EQ(decoded.destination.port, original.destination.port);
}

TEST(ProtocolTest, EncodeReplyEchoesAddress)
{
	socks5::reply reply;
	reply.status = socks5::reply_succeeded;
	reply.bound.type = socks5::address_ipv4;
	reply.bound.ipv4 = boost::asio::ip::make_address_v4("93.184.216.34");
	reply.bound.port = 80;
	EXPECT_EQ(socks5::encode_reply(reply), bytes({0x05, 0x00, 0x00, 0x01, 0x5D, 0xB8, 0xD8, 0x22, 0x00, 0x50}));

	reply.status = socks5::reply_connection_refused;
	const auto data = socks5::encode_reply(reply);
	socks5::reply decoded;
	boost::system::error_code ec;
	EXPECT_EQ(socks5::decode_reply(data.data(), data.size(), decoded, ec), 10u);
	ASSERT_FALSE(ec);
	EXPECT_EQ(decoded.status, socks5::reply_connection_refused);
	EXPECT_EQ(decoded.bound.ipv4, reply.bound.ipv4);
}

TEST(ProtocolTest, EncodeRejectsOversizedDomain)
{
	socks5::request r;
	r.destination.type = socks5::address_domain;
	r.destination.domain.assign(256, 'a');
	EXPECT_THROW(socks5::encode_request(r), std::length_error);

	r.destination.type = 0x02;
	EXPECT_THROW(socks5::encode_request(r), std::invalid_argument);
}

TEST(ProtocolTest, ErrorMessages)
{
	const boost::system::error_code ec = error::unsupported_command;
	EXPECT_EQ(ec.category(), error::get_socks_category());
	EXPECT_EQ(ec.message(), "command not supported");
	EXPECT_STREQ(ec.category().name(), "nanosocks.socks");
}
