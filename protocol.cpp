#include "protocol.h"
#include "socks_error.h"
#include <cstring>
#include <stdexcept>
#include <boost/throw_exception.hpp>

namespace nanosocks {
namespace socks5 {

namespace {

// VER CMD/REP RSV ATYP
const std::size_t header_size = 4;
const std::size_t port_size = 2;

// 地址部分(含端口)的长度, 0 表示还需要更多字节, -1 表示 ATYP 不认识.
int address_length(const boost::uint8_t* data, std::size_t size)
{
	if (size < 1)
		return 0;

	switch (data[0])
	{
	case address_ipv4:
		return 1 + 4 + port_size;
	case address_domain:
		if (size < 2)
			return 0;
		return 1 + 1 + data[1] + port_size;
	case address_ipv6:
		return 1 + 16 + port_size;
	}
	return -1;
}

std::size_t message_length(const boost::uint8_t* data, std::size_t size,
	boost::system::error_code& ec)
{
	ec = boost::system::error_code();
	if (size >= 1 && data[0] != version)
	{
		ec = error::malformed_request;
		return 0;
	}
	if (size >= 3 && data[2] != reserved)
	{
		ec = error::malformed_request;
		return 0;
	}
	if (size < header_size)
		return 0;

	int length = address_length(data + header_size - 1, size - header_size + 1);
	if (length < 0)
	{
		ec = error::malformed_request;
		return 0;
	}
	if (length == 0)
		return 0;
	return header_size - 1 + length;
}

// data 指向 ATYP.
std::size_t decode_address(const boost::uint8_t* data, std::size_t size, address& out)
{
	int length = address_length(data, size);
	if (length <= 0 || size < static_cast<std::size_t>(length))
		return 0;

	out.type = data[0];
	const boost::uint8_t* p = data + 1;
	switch (out.type)
	{
	case address_ipv4:
		{
			boost::asio::ip::address_v4::bytes_type bytes;
			std::memcpy(bytes.data(), p, bytes.size());
			out.ipv4 = boost::asio::ip::address_v4(bytes);
			p += bytes.size();
		}
		break;
	case address_domain:
		{
			std::size_t domain_length = *p++;
			out.domain.assign(reinterpret_cast<const char*>(p), domain_length);
			p += domain_length;
		}
		break;
	case address_ipv6:
		{
			boost::asio::ip::address_v6::bytes_type bytes;
			std::memcpy(bytes.data(), p, bytes.size());
			out.ipv6 = boost::asio::ip::address_v6(bytes);
			p += bytes.size();
		}
		break;
	}
	out.port = static_cast<boost::uint16_t>((p[0] << 8) | p[1]);
	return length;
}

void encode_address(const address& a, std::vector<boost::uint8_t>& out)
{
	out.push_back(a.type);
	switch (a.type)
	{
	case address_ipv4:
		{
			boost::asio::ip::address_v4::bytes_type bytes = a.ipv4.to_bytes();
			out.insert(out.end(), bytes.begin(), bytes.end());
		}
		break;
	case address_domain:
		if (a.domain.size() > 255)
			boost::throw_exception(std::length_error("socks5 domain name longer than 255 bytes"));
		out.push_back(static_cast<boost::uint8_t>(a.domain.size()));
		out.insert(out.end(), a.domain.begin(), a.domain.end());
		break;
	case address_ipv6:
		{
			boost::asio::ip::address_v6::bytes_type bytes = a.ipv6.to_bytes();
			out.insert(out.end(), bytes.begin(), bytes.end());
		}
		break;
	default:
		boost::throw_exception(std::invalid_argument("unknown socks5 address type"));
	}
	out.push_back(static_cast<boost::uint8_t>(a.port >> 8));
	out.push_back(static_cast<boost::uint8_t>(a.port & 0xff));
}

} // namespace

std::size_t greeting_length(const boost::uint8_t* data, std::size_t size,
	boost::system::error_code& ec)
{
	ec = boost::system::error_code();
	if (size >= 1 && data[0] != version)
	{
		ec = error::malformed_greeting;
		return 0;
	}
	if (size < 2)
		return 0;
	return 2 + data[1];
}

std::size_t request_length(const boost::uint8_t* data, std::size_t size,
	boost::system::error_code& ec)
{
	return message_length(data, size, ec);
}

std::size_t reply_length(const boost::uint8_t* data, std::size_t size,
	boost::system::error_code& ec)
{
	return message_length(data, size, ec);
}

std::size_t decode_greeting(const boost::uint8_t* data, std::size_t size,
	greeting& out, boost::system::error_code& ec)
{
	std::size_t length = greeting_length(data, size, ec);
	if (ec || length == 0 || size < length)
	{
		ec = error::malformed_greeting;
		return 0;
	}
	out.methods.assign(data + 2, data + length);
	return length;
}

std::size_t decode_method_selection(const boost::uint8_t* data, std::size_t size,
	boost::uint8_t& method, boost::system::error_code& ec)
{
	if (size < 2 || data[0] != version)
	{
		ec = error::malformed_greeting;
		return 0;
	}
	ec = boost::system::error_code();
	method = data[1];
	return 2;
}

std::size_t decode_request(const boost::uint8_t* data, std::size_t size,
	request& out, boost::system::error_code& ec)
{
	std::size_t length = request_length(data, size, ec);
	if (ec || length == 0 || size < length)
	{
		ec = error::malformed_request;
		return 0;
	}
	out.command = data[1];
	decode_address(data + header_size - 1, length - header_size + 1, out.destination);
	return length;
}

std::size_t decode_reply(const boost::uint8_t* data, std::size_t size,
	reply& out, boost::system::error_code& ec)
{
	std::size_t length = reply_length(data, size, ec);
	if (ec || length == 0 || size < length)
	{
		ec = error::malformed_request;
		return 0;
	}
	out.status = data[1];
	decode_address(data + header_size - 1, length - header_size + 1, out.bound);
	return length;
}

std::vector<boost::uint8_t> encode_greeting(const greeting& g)
{
	if (g.methods.size() > 255)
		boost::throw_exception(std::length_error("socks5 greeting offers more than 255 methods"));

	std::vector<boost::uint8_t> out;
	out.reserve(2 + g.methods.size());
	out.push_back(version);
	out.push_back(static_cast<boost::uint8_t>(g.methods.size()));
	out.insert(out.end(), g.methods.begin(), g.methods.end());
	return out;
}

std::vector<boost::uint8_t> encode_method_selection(boost::uint8_t method)
{
	std::vector<boost::uint8_t> out(2);
	out[0] = version;
	out[1] = method;
	return out;
}

std::vector<boost::uint8_t> encode_request(const request& r)
{
	std::vector<boost::uint8_t> out;
	out.push_back(version);
	out.push_back(r.command);
	out.push_back(reserved);
	encode_address(r.destination, out);
	return out;
}

std::vector<boost::uint8_t> encode_reply(const reply& r)
{
	std::vector<boost::uint8_t> out;
	out.push_back(version);
	out.push_back(r.status);
	out.push_back(reserved);
	encode_address(r.bound, out);
	return out;
}

} // namespace socks5
} // namespace nanosocks
