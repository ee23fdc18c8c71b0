/*

tool_call.cpp
-------------

Invokes any mailbox tool by name with a JSON argument object, the way an agent
host would, and prints the response. Without arguments, prints the tool
descriptors.

    tool_call <mailbox-dir>
    tool_call <mailbox-dir> <tool> ['{"maxResults": 5}']


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <mailfence/security/boundary.hpp>
#include <mailfence/settings.hpp>
#include <mailfence/source/json_mail_source.hpp>
#include <mailfence/throwing.hpp>
#include <mailfence/tools/mailbox_tools.hpp>
#include "example_util.hpp"


using mailfence::tools::mailbox_tools;


int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 4)
    {
        std::cerr << "usage: " << argv[0] << " <mailbox-dir> [<tool> [<json-args>]]\n";
        return EXIT_FAILURE;
    }

    if (argc == 2)
    {
        nlohmann::ordered_json list = nlohmann::ordered_json::array();
        for (const auto& d : mailbox_tools::descriptors())
            list.push_back(nlohmann::ordered_json(d));
        std::cout << list.dump(2) << "\n";
        return EXIT_SUCCESS;
    }

    try
    {
        const auto cfg = mailfence::unwrap(mailfence::settings::from_environment());
        mailfence::security::boundary_generator boundaries;
        static_cast<void>(mailfence::unwrap(boundaries.generate()));

        mailfence::tools::arguments args = nlohmann::json::object();
        if (argc == 4)
        {
            args = nlohmann::json::parse(argv[3], nullptr, false);
            if (args.is_discarded() || !args.is_object())
            {
                std::cerr << "arguments must be a JSON object\n";
                return EXIT_FAILURE;
            }
        }

        mailfence::source::json_mail_source mailbox(argv[1]);
        mailbox_tools tools(mailbox, cfg, boundaries);
        const auto res = tools.call(argv[2], args);
        print_result(res);
        return res.is_error ? EXIT_FAILURE : EXIT_SUCCESS;
    }
    catch (const mailfence::exception& exc)
    {
        print_error(exc.info());
        // Startup failures (no home directory, no random source) get their own exit status.
        return exc.is_fatal() ? 2 : EXIT_FAILURE;
    }
}
