#pragma once
#include <string>
#include <boost/log/trivial.hpp>

#define NANOSOCKS_LOG(severity) BOOST_LOG_TRIVIAL(severity)

namespace nanosocks {

// 初始化控制台日志. level 不认识时返回 false, 此时日志保持默认设置.
bool init_logging(const std::string& level);

} // namespace nanosocks
