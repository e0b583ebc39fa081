#include "logger.h"
#include <iostream>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace nanosocks {

bool init_logging(const std::string& level)
{
	logging::trivial::severity_level severity = logging::trivial::info;
	if (!logging::trivial::from_string(level.c_str(), level.size(), severity))
		return false;

	logging::add_common_attributes();
	logging::add_console_log(std::clog,
		keywords::format = (
			expr::stream
				<< "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
				<< "] [" << logging::trivial::severity
				<< "] " << expr::smessage
		),
		keywords::auto_flush = true
	);
	logging::core::get()->set_filter(logging::trivial::severity >= severity);
	return true;
}

} // namespace nanosocks
