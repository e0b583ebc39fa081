#pragma once
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/cstdint.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/shared_ptr.hpp>
#include "protocol.h"

namespace nanosocks {

class address_resolver;

class session
		: public boost::enable_shared_from_this<session>
{
public:
	enum state
	{
		state_await_greeting,
		state_await_request,
		state_connecting,
		state_relaying,
		state_closed,
		state_failed
	};

	session(boost::asio::io_service& io_service, boost::asio::ip::tcp::socket socket,
		boost::shared_ptr<address_resolver> resolver);

	void start();

private:
	typedef std::size_t (*length_function)(const boost::uint8_t*, std::size_t, boost::system::error_code&);

	void run(boost::asio::yield_context yield);

	boost::system::error_code do_greeting(boost::asio::yield_context yield);
	boost::system::error_code do_request(boost::asio::yield_context yield);
	boost::system::error_code do_connect(boost::asio::yield_context yield);
	void do_relay(boost::asio::yield_context yield);

	boost::system::error_code read_message(std::vector<boost::uint8_t>& buffer,
		length_function length_of, boost::system::error_code truncated, boost::asio::yield_context yield);
	boost::system::error_code write_reply(boost::uint8_t status, boost::asio::yield_context yield);
	void close();

private:
	boost::asio::strand<boost::asio::io_context::executor_type> strand_;
	boost::asio::ip::tcp::socket socket_;
	boost::asio::ip::tcp::socket target_;
	boost::shared_ptr<address_resolver> resolver_;
	socks5::request request_;
	state state_;
	std::string peer_;
};

// Listener 的入口, 每个连接一个 session, 互不影响.
void handle_connection(boost::asio::io_service& io_service, boost::asio::ip::tcp::socket socket,
	boost::shared_ptr<address_resolver> resolver);

} // namespace nanosocks
