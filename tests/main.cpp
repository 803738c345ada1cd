// Copyright (c) 2016 Barobo, Inc.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <usbmon/log.hpp>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <exception>
#include <iostream>

namespace po = boost::program_options;

int main (int argc, char** argv) {
    // We need a custom main() because we want to make sure we set up logging only once. Our
    // options are picked out of the command line and everything else goes to doctest, so
    // `usbmon-tests --log-level=debug -tc="*monitor*"` works.
    auto desc = usbmon::log::optionsDescription();
    po::variables_map options;
    try {
        auto parsed = po::command_line_parser(argc, argv).options(desc).allow_unregistered().run();
        po::store(parsed, options);
        po::notify(options);
    }
    catch (const po::error& e) {
        std::cerr << e.what() << '\n' << desc << '\n';
        return 1;
    }

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
