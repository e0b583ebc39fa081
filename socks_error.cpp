#include "socks_error.h"
#include <string>

namespace nanosocks {
namespace error {

namespace {

class socks_category
	: public boost::system::error_category
{
public:
	const char* name() const BOOST_NOEXCEPT
	{
		return "nanosocks.socks";
	}

	std::string message(int value) const
	{
		switch (value)
		{
		case malformed_greeting:
			return "malformed greeting";
		case unsupported_auth:
			return "no acceptable authentication method";
		case malformed_request:
			return "malformed request";
		case unsupported_command:
			return "command not supported";
		case unsupported_address_family:
			return "address type not supported";
		case nxdomain:
			return "host name could not be resolved";
		case connection_refused:
			return "connection refused by destination";
		case dial_failed:
			return "could not connect to destination";
		case stream_closed:
			return "stream closed";
		}
		return "nanosocks.socks error";
	}
};

} // namespace

const boost::system::error_category& get_socks_category()
{
	static socks_category instance;
	return instance;
}

} // namespace error
} // namespace nanosocks
