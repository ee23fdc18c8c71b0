/*

read_email.cpp
--------------

Reads one message from an offline mailbox directory and prints the sanitized
tool response: the security context followed by the wrapped message record.

    read_email <mailbox-dir> <message-id>


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <mailfence/security/boundary.hpp>
#include <mailfence/settings.hpp>
#include <mailfence/source/json_mail_source.hpp>
#include <mailfence/tools/mailbox_tools.hpp>
#include "example_util.hpp"


int main(int argc, char* argv[])
{
    if (argc != 3)
    {
        std::cerr << "usage: " << argv[0] << " <mailbox-dir> <message-id>\n";
        return EXIT_FAILURE;
    }

    auto cfg = mailfence::settings::from_environment();
    if (!cfg)
    {
        print_error(cfg.error());
        return EXIT_FAILURE;
    }

    mailfence::security::boundary_generator boundaries;
    if (auto probe = boundaries.generate(); !probe)
    {
        print_error(probe.error());
        return EXIT_FAILURE;
    }

    mailfence::source::json_mail_source mailbox(argv[1]);
    mailfence::tools::mailbox_tools tools(mailbox, *cfg, boundaries);

    mailfence::tools::arguments args;
    args["id"] = argv[2];
    const auto res = tools.read_email(args);
    print_result(res);
    return res.is_error ? EXIT_FAILURE : EXIT_SUCCESS;
}
