/*
 * socks_error.h , nanosocks 的错误码.
 */

#pragma once
#include <boost/system/error_code.hpp>

namespace nanosocks {
namespace error {

enum socks_errors
{
	malformed_greeting = 1,
	unsupported_auth,
	malformed_request,
	unsupported_command,
	unsupported_address_family,
	nxdomain,
	connection_refused,
	dial_failed,
	// 转发时一端关闭, 不算真正的错误.
	stream_closed
};

const boost::system::error_category& get_socks_category();

inline boost::system::error_code make_error_code(socks_errors e)
{
	return boost::system::error_code(static_cast<int>(e), get_socks_category());
}

} // namespace error
} // namespace nanosocks

namespace boost {
namespace system {

template <>
struct is_error_code_enum<nanosocks::error::socks_errors>
{
	static const bool value = true;
};

} // namespace system
} // namespace boost
