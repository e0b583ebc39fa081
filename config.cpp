#include "config.h"
#include <algorithm>
#include <fstream>
#include <ostream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace nanosocks {

namespace {

// NANOSOCKS_LOG_LEVEL -> log-level
std::string environment_name(const std::string& name)
{
	const std::string prefix = "NANOSOCKS_";
	if (name.compare(0, prefix.size(), prefix) != 0)
		return std::string();

	std::string option = boost::algorithm::to_lower_copy(name.substr(prefix.size()));
	std::replace(option.begin(), option.end(), '_', '-');
	if (option == "listen" || option == "port" || option == "threads" || option == "log-level")
		return option;
	return std::string();
}

} // namespace

bool parse_config(int argc, char* argv[], server_config& config, std::ostream& help_out)
{
	po::options_description generic("Generic options");
	generic.add_options()
		("help,h", "produce help message")
		("config,c", po::value<std::string>(&config.config_file), "config file")
	;

	po::options_description settings("Settings");
	settings.add_options()
		("listen,l", po::value<std::string>(&config.listen)->default_value(config.listen), "listen address")
		("port,p", po::value<unsigned short>(&config.port)->default_value(config.port), "listen port")
		("threads,t", po::value<std::size_t>(&config.threads)->default_value(config.threads), "worker threads")
		("log-level", po::value<std::string>(&config.log_level)->default_value(config.log_level),
			"trace, debug, info, warning, error or fatal")
	;

	po::options_description cmdline;
	cmdline.add(generic).add(settings);

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, cmdline), vm);

	if (vm.count("help"))
	{
		help_out << "usage: nanosocks [options]\n" << cmdline << std::endl;
		return false;
	}

	if (vm.count("config"))
	{
		const std::string file = vm["config"].as<std::string>();
		if (!fs::exists(file))
			throw po::error("config file " + file + " does not exist");

		std::ifstream ifs(file.c_str());
		if (!ifs)
			throw po::error("can not open config file " + file);
		po::store(po::parse_config_file(ifs, settings), vm);
	}

	po::store(po::parse_environment(settings, &environment_name), vm);
	po::notify(vm);

	if (config.threads == 0)
		throw po::error("threads must be at least 1");
	return true;
}

} // namespace nanosocks
