#include "pch.hpp"
#include "address_resolver.h"
#include "logger.h"
#include "socks_error.h"

using ip::tcp;

namespace nanosocks {

address_resolver::address_resolver(asio::io_service& io_service)
	: io_service_(io_service)
{
}

address_resolver::~address_resolver()
{
}

tcp::endpoint address_resolver::resolve(const socks5::address& destination,
	asio::yield_context yield, boost::system::error_code& ec)
{
	ec = boost::system::error_code();
	switch (destination.type)
	{
	case socks5::address_ipv4:
		return tcp::endpoint(destination.ipv4, destination.port);
	case socks5::address_domain:
		return resolve_name(destination.domain, destination.port, yield, ec);
	case socks5::address_ipv6:
		ec = error::unsupported_address_family;
		return tcp::endpoint();
	}
	ec = error::malformed_request;
	return tcp::endpoint();
}

tcp::endpoint address_resolver::resolve_name(const std::string& host,
	boost::uint16_t port, asio::yield_context yield, boost::system::error_code& ec)
{
	if (host.empty())
	{
		ec = error::nxdomain;
		return tcp::endpoint();
	}

	// 只要 IPv4 结果, 取第一个.
	tcp::resolver resolver(io_service_);
	tcp::resolver::results_type results = resolver.async_resolve(tcp::v4(),
		host, boost::lexical_cast<std::string>(port),
		tcp::resolver::numeric_service, yield[ec]);
	if (ec || results.empty())
	{
		NANOSOCKS_LOG(debug) << "resolve " << host << " failed: "
			<< (ec ? ec.message() : std::string("no address"));
		ec = error::nxdomain;
		return tcp::endpoint();
	}
	return results.begin()->endpoint();
}

} // namespace nanosocks
