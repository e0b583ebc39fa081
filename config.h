#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>

namespace nanosocks {

struct server_config
{
	server_config()
		: listen("0.0.0.0")
		, port(1080)
		, threads(1)
		, log_level("info")
	{
	}

	std::string listen;
	unsigned short port;
	std::size_t threads;
	std::string log_level;
	std::string config_file;
};

/**
 * 命令行 > 配置文件 > NANOSOCKS_* 环境变量.
 *
 * 返回 false 表示只打印了 --help, 调用者应当直接退出.
 * 参数错误时抛出 boost::program_options::error.
 */
bool parse_config(int argc, char* argv[], server_config& config, std::ostream& help_out);

} // namespace nanosocks
