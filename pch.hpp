
#pragma once

// for pre-compiled header

#include <algorithm>
#include <string>
#include <vector>

#include <boost/version.hpp>
#include <boost/cstdint.hpp>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/make_shared.hpp>
#include <boost/ref.hpp>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>

#include <boost/lexical_cast.hpp>

namespace asio = boost::asio;
namespace ip = asio::ip;
using boost::make_shared;
