#include <csignal>
#include <iostream>
#include <boost/asio.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/thread.hpp>
#include "config.h"
#include "logger.h"
#include "socks_server.h"

namespace asio = boost::asio;
using asio::ip::tcp;
using namespace std;

int main(int argc, char* argv[])
{
	nanosocks::server_config config;
	try
	{
		if (!nanosocks::parse_config(argc, argv, config, cout))
			return 0;
	}
	catch (boost::program_options::error& e)
	{
		cerr << "nanosocks: " << e.what() << endl;
		return 1;
	}

	if (!nanosocks::init_logging(config.log_level))
	{
		cerr << "nanosocks: unknown log level " << config.log_level << endl;
		return 1;
	}

	boost::system::error_code ec;
	asio::ip::address address = asio::ip::make_address(config.listen, ec);
	if (ec)
	{
		cerr << "nanosocks: bad listen address " << config.listen << ": " << ec.message() << endl;
		return 1;
	}

	asio::io_service io;
	tcp::endpoint endpoint(address, config.port);
	boost::scoped_ptr<nanosocks::socks_server> server;
	try
	{
		server.reset(new nanosocks::socks_server(io, endpoint));
	}
	catch (boost::system::system_error& e)
	{
		NANOSOCKS_LOG(fatal) << "can not listen on " << endpoint << ": " << e.what();
		return 1;
	}
	server->start();

	asio::signal_set signals(io, SIGINT, SIGTERM);
	signals.async_wait(
		[&](const boost::system::error_code& error, int signal_number)
	{
		if (error)
			return;
		NANOSOCKS_LOG(info) << "signal " << signal_number << ", shutting down";
		server->stop();
		io.stop();
	});

	boost::thread_group workers;
	for (std::size_t i = 1; i < config.threads; ++i)
		workers.create_thread([&io]() { io.run(); });
	io.run();
	workers.join_all();
	return 0;
}
