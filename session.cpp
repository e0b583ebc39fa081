#include "pch.hpp"
#include "session.h"
#include "address_resolver.h"
#include "logger.h"
#include "socks_error.h"
#include "splice.hpp"

using ip::tcp;

namespace nanosocks {

namespace {

const char* state_name(session::state s)
{
	switch (s)
	{
	case session::state_await_greeting:
		return "greeting";
	case session::state_await_request:
		return "request";
	case session::state_connecting:
		return "connect";
	case session::state_relaying:
		return "relay";
	case session::state_closed:
		return "closed";
	case session::state_failed:
		return "failed";
	}
	return "unknown";
}

} // namespace

session::session(asio::io_service& io_service, tcp::socket socket,
	boost::shared_ptr<address_resolver> resolver)
	: strand_(asio::make_strand(io_service))
	, socket_(std::move(socket))
	, target_(io_service)
	, resolver_(resolver)
	, state_(state_await_greeting)
{

}

void session::start()
{
	boost::system::error_code ec;
	tcp::endpoint peer = socket_.remote_endpoint(ec);
	if (!ec)
		peer_ = boost::lexical_cast<std::string>(peer);

	auto self = shared_from_this();
	asio::spawn(strand_,
				[this, self]
				(asio::yield_context yield)
	{
		run(yield);
	});
}

void session::run(asio::yield_context yield)
{
	// 握手 -> 请求 -> 连接目标 -> 转发, 严格按顺序, 任何一步失败都走 close().
	while (state_ != state_closed && state_ != state_failed)
	{
		state current = state_;
		boost::system::error_code ec;
		switch (current)
		{
		case state_await_greeting:
			ec = do_greeting(yield);
			break;
		case state_await_request:
			ec = do_request(yield);
			break;
		case state_connecting:
			ec = do_connect(yield);
			break;
		case state_relaying:
			do_relay(yield);
			break;
		case state_closed:
		case state_failed:
			break;
		}

		if (ec)
		{
			NANOSOCKS_LOG(warning) << peer_ << " " << state_name(current)
				<< " failed: " << ec.message();
			state_ = state_failed;
		}
	}

	close();
}

boost::system::error_code session::do_greeting(asio::yield_context yield)
{
	std::vector<boost::uint8_t> buffer;
	boost::system::error_code ec = read_message(buffer,
		&socks5::greeting_length, error::malformed_greeting, yield);
	if (ec)
		return ec;

	socks5::greeting greeting;
	socks5::decode_greeting(buffer.data(), buffer.size(), greeting, ec);
	if (ec)
		return ec;

	// 只支持无认证, 客户端没提供就直接断开.
	if (std::find(greeting.methods.begin(), greeting.methods.end(),
			socks5::method_no_auth) == greeting.methods.end())
		return error::unsupported_auth;

	std::vector<boost::uint8_t> selection = socks5::encode_method_selection(socks5::method_no_auth);
	asio::async_write(socket_, asio::buffer(selection), yield[ec]);
	if (ec)
		return ec;

	state_ = state_await_request;
	return ec;
}

boost::system::error_code session::do_request(asio::yield_context yield)
{
	boost::system::error_code ec;
	std::vector<boost::uint8_t> buffer(4);
	asio::async_read(socket_, asio::buffer(buffer), yield[ec]);
	if (ec == asio::error::eof)
		return error::malformed_request;
	if (ec)
		return ec;

	socks5::request_length(buffer.data(), buffer.size(), ec);
	if (ec)
		return ec;
	if (buffer[1] != socks5::command_connect)
		return error::unsupported_command;
	if (buffer[3] == socks5::address_ipv6)
		return error::unsupported_address_family;

	ec = read_message(buffer, &socks5::request_length, error::malformed_request, yield);
	if (ec)
		return ec;

	socks5::decode_request(buffer.data(), buffer.size(), request_, ec);
	if (ec)
		return ec;

	state_ = state_connecting;
	return ec;
}

boost::system::error_code session::do_connect(asio::yield_context yield)
{
	boost::system::error_code ec;
	tcp::endpoint endpoint = resolver_->resolve(request_.destination, yield, ec);
	if (ec == error::nxdomain)
	{
		write_reply(socks5::reply_host_unreachable, yield);
		return ec;
	}
	if (ec)
		return ec;

	target_.async_connect(endpoint, yield[ec]);
	if (ec)
	{
		NANOSOCKS_LOG(debug) << peer_ << " connect " << endpoint << ": " << ec.message();
		if (ec == asio::error::connection_refused)
		{
			write_reply(socks5::reply_connection_refused, yield);
			return error::connection_refused;
		}
		write_reply(socks5::reply_general_failure, yield);
		return error::dial_failed;
	}

	NANOSOCKS_LOG(debug) << peer_ << " connected to " << endpoint;

	ec = write_reply(socks5::reply_succeeded, yield);
	if (ec)
		return ec;

	state_ = state_relaying;
	return ec;
}

void session::do_relay(asio::yield_context yield)
{
	typedef splice<session, tcp::socket, tcp::socket> splice_type;

	splice_type::pointer relay(new splice_type(shared_from_this(), socket_, target_));
	relay->run(yield);

	NANOSOCKS_LOG(debug) << peer_ << " closed, "
		<< relay->s1s2_transferred() << " bytes sent, "
		<< relay->s2s1_transferred() << " bytes received";
	state_ = state_closed;
}

boost::system::error_code session::read_message(std::vector<boost::uint8_t>& buffer,
	length_function length_of, boost::system::error_code truncated, asio::yield_context yield)
{
	boost::system::error_code ec;
	for (;;)
	{
		std::size_t length = length_of(buffer.data(), buffer.size(), ec);
		if (ec)
			return ec;
		if (length != 0 && length <= buffer.size())
			return ec;

		// 不多读一个字节, 长度还不确定时一次只读一个.
		std::size_t offset = buffer.size();
		buffer.resize(length == 0 ? offset + 1 : length);
		asio::async_read(socket_, asio::buffer(&buffer[offset], buffer.size() - offset), yield[ec]);
		if (ec == asio::error::eof)
			return truncated;
		if (ec)
			return ec;
	}
}

boost::system::error_code session::write_reply(boost::uint8_t status, asio::yield_context yield)
{
	// BND.ADDR/BND.PORT 直接回显请求里的地址.
	socks5::reply reply;
	reply.status = status;
	reply.bound = request_.destination;

	boost::system::error_code ec;
	std::vector<boost::uint8_t> buffer = socks5::encode_reply(reply);
	asio::async_write(socket_, asio::buffer(buffer), yield[ec]);
	if (ec)
		NANOSOCKS_LOG(debug) << peer_ << " write reply: " << ec.message();
	return ec;
}

void session::close()
{
	boost::system::error_code ignored_ec;
	socket_.close(ignored_ec);
	target_.close(ignored_ec);
}

void handle_connection(asio::io_service& io_service, tcp::socket socket,
	boost::shared_ptr<address_resolver> resolver)
{
	boost::make_shared<session>(boost::ref(io_service), std::move(socket), resolver)->start();
}

} // namespace nanosocks
