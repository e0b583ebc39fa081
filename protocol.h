/*
 * protocol.h , socks5 报文的编码和解码, 不做任何 I/O.
 *
 * 只实现本程序用到的子集: greeting, method selection, request, reply.
 * 所有多字节整数都是网络字节序.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <boost/cstdint.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/system/error_code.hpp>

namespace nanosocks {
namespace socks5 {

const boost::uint8_t version = 0x05;
const boost::uint8_t reserved = 0x00;

enum auth_method
{
	method_no_auth = 0x00,
	method_gssapi = 0x01,
	method_username_password = 0x02,
	method_no_acceptable = 0xff
};

enum command_code
{
	command_connect = 0x01,
	command_bind = 0x02,
	command_udp_associate = 0x03
};

enum address_type
{
	address_ipv4 = 0x01,
	address_domain = 0x03,
	address_ipv6 = 0x04
};

enum reply_status
{
	reply_succeeded = 0x00,
	reply_general_failure = 0x01,
	reply_host_unreachable = 0x04,
	reply_connection_refused = 0x05
};

struct greeting
{
	std::vector<boost::uint8_t> methods;
};

// DST.ADDR/DST.PORT 或 BND.ADDR/BND.PORT, 只有 type 对应的成员有效.
struct address
{
	address()
		: type(address_ipv4)
		, port(0)
	{
	}

	boost::uint8_t type;
	boost::asio::ip::address_v4 ipv4;
	std::string domain;
	boost::asio::ip::address_v6 ipv6;
	boost::uint16_t port;
};

struct request
{
	request()
		: command(command_connect)
	{
	}

	boost::uint8_t command;
	socks5::address destination;
};

struct reply
{
	reply()
		: status(reply_succeeded)
	{
	}

	boost::uint8_t status;
	socks5::address bound;
};

// 根据已读到的前 size 个字节算出整个报文的长度, 0 表示还要再读, 报文不合法时设置 ec.
std::size_t greeting_length(const boost::uint8_t* data, std::size_t size, boost::system::error_code& ec);
std::size_t request_length(const boost::uint8_t* data, std::size_t size, boost::system::error_code& ec);
std::size_t reply_length(const boost::uint8_t* data, std::size_t size, boost::system::error_code& ec);

// 只解一个报文, 返回消耗的字节数; 数据不够或者格式错返回 0 并设置 ec.
std::size_t decode_greeting(const boost::uint8_t* data, std::size_t size, greeting& out, boost::system::error_code& ec);
std::size_t decode_method_selection(const boost::uint8_t* data, std::size_t size, boost::uint8_t& method, boost::system::error_code& ec);
std::size_t decode_request(const boost::uint8_t* data, std::size_t size, request& out, boost::system::error_code& ec);
std::size_t decode_reply(const boost::uint8_t* data, std::size_t size, reply& out, boost::system::error_code& ec);

// 域名超过 255 字节抛 std::length_error, ATYP 不认识抛 std::invalid_argument.
std::vector<boost::uint8_t> encode_greeting(const greeting& g);
std::vector<boost::uint8_t> encode_method_selection(boost::uint8_t method);
std::vector<boost::uint8_t> encode_request(const request& r);
std::vector<boost::uint8_t> encode_reply(const reply& r);

} // namespace socks5
} // namespace nanosocks
