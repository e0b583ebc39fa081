#include "pch.hpp"
#include "socks_server.h"
#include "address_resolver.h"
#include "logger.h"
#include "session.h"

using ip::tcp;

namespace nanosocks {

socks_server::socks_server(asio::io_service &io_service, tcp::endpoint endpoint)
	: io_service_(io_service)
	, strand_(asio::make_strand(io_service))
	, acceptor_(io_service_, endpoint)
	, resolver_(boost::make_shared<address_resolver>(boost::ref(io_service_)))
{

}

socks_server::socks_server(asio::io_service &io_service, tcp::endpoint endpoint,
	boost::shared_ptr<address_resolver> resolver)
	: io_service_(io_service)
	, strand_(asio::make_strand(io_service))
	, acceptor_(io_service_, endpoint)
	, resolver_(resolver)
{

}

void socks_server::start()
{
	NANOSOCKS_LOG(info) << "listening on " << local_endpoint();

	// acceptor 只在 strand_ 上访问, stop() 也投递到这里.
	asio::spawn(strand_,
				[this]
				(asio::yield_context yield)
	{
		tcp::socket socket(io_service_);
		for(;;)
		{
			boost::system::error_code ec;
			acceptor_.async_accept(socket, yield[ec]);
			if(!ec)
			{
				NANOSOCKS_LOG(debug) << "accept client " << socket.remote_endpoint(ec);
				handle_connection(io_service_, std::move(socket), resolver_);
			}
			else if(ec == asio::error::operation_aborted || !acceptor_.is_open())
			{
				return;
			}
			else
			{
				// 比如 fd 用完了, 接着 accept, 不影响已有的连接.
				NANOSOCKS_LOG(error) << "accept: " << ec.message();
			}
		}
	});
}

void socks_server::stop()
{
	asio::post(strand_, [this]()
	{
		boost::system::error_code ec;
		acceptor_.close(ec);
		if (ec)
			NANOSOCKS_LOG(warning) << "close listener: " << ec.message();
		else
			NANOSOCKS_LOG(info) << "listener closed";
	});
}

tcp::endpoint socks_server::local_endpoint() const
{
	boost::system::error_code ec;
	return acceptor_.local_endpoint(ec);
}

} // namespace nanosocks
