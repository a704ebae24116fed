//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/span.hpp>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>

#include "application.hpp"
#include "config.hpp"

using namespace lobbychat;

static int main_impl(int argc, char* argv[])
{
    // Command line arguments and environment variables
    auto config = load_config(boost::span<const char* const>(argv, static_cast<std::size_t>(argc)));
    if (config.has_error())
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port>\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 0.0.0.0 8080\n"
                  << "Storage and limits are configured through environment variables (LOBBYCHAT_STORAGE, "
                     "MYSQL_HOST, REDIS_HOST, LOBBYCHAT_NOTIFY_SECRET...)\n";
        return EXIT_FAILURE;
    }

    application app(std::move(config).value());

    // Bind the listening socket
    if (app.setup())
        return EXIT_FAILURE;

    // Run until we get a SIGINT or SIGTERM
    app.run_until_completion(true);
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try
    {
        return main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
