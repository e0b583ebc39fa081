/**
 * splice.hpp , implements the splice syntactics.
 *
 * 两个方向各跑一个协程, 任何一个方向结束 (EOF 或者出错) 就把两个 socket
 * 都关掉, 另一个方向挂起的读写随之以 operation_aborted 返回.
 * run() 要等两个方向都结束才返回.
 */

#pragma once
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/cstdint.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include "logger.h"
#include "socks_error.h"

namespace nanosocks {

template < class T , class S1, class S2>
class splice
	: public boost::enable_shared_from_this<splice<T,S1,S2> >,
	  private boost::noncopyable
{
	using boost::enable_shared_from_this<splice<T,S1,S2> >::shared_from_this;
public:
	typedef boost::shared_ptr<splice>	pointer;

	splice(boost::shared_ptr<T> _owner, S1& _s1, S2& _s2)
		: s1(_s1)
		, s2(_s2)
		, owner(_owner)
		, done(_s1.get_executor())
		, pending(0)
		, s1s2_bytes(0)
		, s2s1_bytes(0)
	{
	}

	// 必须在 strand 上的协程里调用.
	void run(boost::asio::yield_context yield)
	{
		pointer self = shared_from_this();
		pending = 2;
		done.expires_at(boost::asio::steady_timer::time_point::max());

		boost::asio::spawn(yield,
			[this, self](boost::asio::yield_context yield)
		{
			s1s2_ec = transfer(s1, s2, s1s2_bytes, yield);
		});
		boost::asio::spawn(yield,
			[this, self](boost::asio::yield_context yield)
		{
			s2s1_ec = transfer(s2, s1, s2s1_bytes, yield);
		});

		while (pending != 0)
		{
			boost::system::error_code ec;
			done.async_wait(yield[ec]);
		}
	}

	boost::uint64_t s1s2_transferred() const { return s1s2_bytes; }
	boost::uint64_t s2s1_transferred() const { return s2s1_bytes; }

	const boost::system::error_code& s1s2_error() const { return s1s2_ec; }
	const boost::system::error_code& s2s1_error() const { return s2s1_ec; }

private:
	template <class From, class To>
	boost::system::error_code transfer(From& from, To& to, boost::uint64_t& counter,
		boost::asio::yield_context yield)
	{
		std::vector<char> buffer(8192);
		boost::system::error_code ec;
		for (;;)
		{
			std::size_t bytes_transferred = from.async_read_some(boost::asio::buffer(buffer), yield[ec]);
			if (ec)
				break;
			boost::asio::async_write(to, boost::asio::buffer(buffer.data(), bytes_transferred), yield[ec]);
			if (ec)
				break;
			counter += bytes_transferred;
		}

		close(from);
		close(to);

		if (--pending == 0)
			done.cancel();

		NANOSOCKS_LOG(debug) << "splice direction ended after " << counter
			<< " bytes: " << ec.message();
		if (ec == boost::asio::error::eof || ec == boost::asio::error::operation_aborted)
			return error::stream_closed;
		return ec;
	}

	template <class S>
	static void close(S& s)
	{
		boost::system::error_code ignored_ec;
		s.lowest_layer().shutdown(boost::asio::socket_base::shutdown_both, ignored_ec);
		s.lowest_layer().close(ignored_ec);
	}

private:
	S1&							s1; // 两个 socket
	S2&							s2;
	boost::shared_ptr<T>		owner; // 确保 owner 不被析构掉.
	boost::asio::steady_timer	done;
	int							pending;
	boost::uint64_t				s1s2_bytes, s2s1_bytes;
	boost::system::error_code	s1s2_ec, s2s1_ec;
};

} // namespace nanosocks
