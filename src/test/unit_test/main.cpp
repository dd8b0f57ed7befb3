//------------------------------------------------------------------------------
/*
    This file is part of peerlend
    Copyright (c) 2024 The peerlend developers

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <xrpl/beast/unit_test/amount.h>
#include <xrpl/beast/unit_test/dstream.h>
#include <xrpl/beast/unit_test/global_suites.h>
#include <xrpl/beast/unit_test/match.h>
#include <xrpl/beast/unit_test/reporter.h>
#include <xrpl/beast/unit_test/suite.h>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace peerlend {
namespace test {

static std::string
prefix(beast::unit_test::suite_info const& s)
{
    if (s.manual())
        return "|M| ";
    return "    ";
}

// Used with the --print command line option
static void
print(std::ostream& os)
{
    using namespace beast::unit_test;

    std::size_t manual = 0;
    os << "------------------------------------------\n";
    for (auto const& s : global_suites())
    {
        os << prefix(s) << s.full_name() << '\n';
        if (s.manual())
            ++manual;
    }
    os << amount(global_suites().size(), "suite") << " total, "
       << amount(manual, "manual suite") << '\n';
    os << "------------------------------------------" << std::endl;
}

}  // namespace test
}  // namespace peerlend

int
main(int argc, char const* argv[])
{
    using namespace beast::unit_test;
    namespace po = boost::program_options;

    po::options_description desc("Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Produce a help message")
        ("print,p", "Print the list of available test suites")
        ("suites,s", po::value<std::string>(),
         "Comma separated suites to run, e.g. Loan,LedgerConfig");
    // clang-format on

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (std::exception const& e)
    {
        std::cerr << "peerlend_tests: " << e.what() << '\n' << desc;
        return EXIT_FAILURE;
    }

    dstream log(std::cerr);
    std::unitbuf(log);

    if (vm.count("help"))
    {
        log << desc << std::endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("print"))
    {
        peerlend::test::print(log);
        return EXIT_SUCCESS;
    }

    reporter r(log);
    bool failed;
    if (vm.count("suites"))
        failed = r.run_each_if(
            global_suites(), match_auto(vm["suites"].as<std::string>()));
    else
        failed = r.run_each(global_suites());

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
