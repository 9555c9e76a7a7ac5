/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <openssl/ssl.h>

int main( int argc, char* argv[] )
{
	OPENSSL_init_ssl(0, nullptr);

	return Catch::Session().run(argc, argv);
}
