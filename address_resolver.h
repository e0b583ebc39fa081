#pragma once
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/noncopyable.hpp>
#include "protocol.h"

namespace nanosocks {

/**
 * 把 request 里的 DST.ADDR/DST.PORT 变成可以 connect 的 endpoint.
 *
 * IPv4 地址直接使用, 域名每次都重新解析, 不做缓存. IPv6 一律拒绝.
 */
class address_resolver
	: private boost::noncopyable
{
public:
	explicit address_resolver(boost::asio::io_service& io_service);
	virtual ~address_resolver();

	boost::asio::ip::tcp::endpoint resolve(const socks5::address& destination,
		boost::asio::yield_context yield, boost::system::error_code& ec);

protected:
	// 解析失败一律报 error::nxdomain.
	virtual boost::asio::ip::tcp::endpoint resolve_name(const std::string& host,
		boost::uint16_t port, boost::asio::yield_context yield, boost::system::error_code& ec);

	boost::asio::io_service& io_service_;
};

} // namespace nanosocks
