/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "apx/Server.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/diagnostic_information.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace apx {

void run(const Configuration& cfg)
{
	auto const threads = std::max<std::size_t>(1, cfg.thread_count());

	Server server{cfg};
	server.listen();

	// Run the I/O service on the requested number of threads
	std::vector<std::thread> v;
	v.reserve(threads - 1);
	for (auto i = threads - 1; i > 0; --i)
		v.emplace_back([&server]{server.get_io_context().run();});

	server.get_io_context().run();

	for (auto& t : v)
		t.join();
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace apx;
	try
	{
		Configuration cfg{argc, argv, ::getenv("ASSET_PROXY_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		Log(LOG_NOTICE, "asset_proxy (version %1%) starting", constants::version);
		run(cfg);
		return EXIT_SUCCESS;
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
	catch (...)
	{
		Log(LOG_CRIT, "Uncaught unknown exception");
		return EXIT_FAILURE;
	}
}
