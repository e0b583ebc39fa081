#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/shared_ptr.hpp>

namespace nanosocks {

class address_resolver;

class socks_server
{
public:
	socks_server(boost::asio::io_service& io_service, boost::asio::ip::tcp::endpoint endpoint);
	socks_server(boost::asio::io_service& io_service, boost::asio::ip::tcp::endpoint endpoint,
		boost::shared_ptr<address_resolver> resolver);

	void start();
	// 关闭 listener, 已经建立的 session 不受影响. 可以在任意线程调用.
	void stop();

	boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
	boost::asio::io_service& io_service_;
	boost::asio::strand<boost::asio::io_context::executor_type> strand_;
	boost::asio::ip::tcp::acceptor acceptor_;
	boost::shared_ptr<address_resolver> resolver_;
};

} // namespace nanosocks
