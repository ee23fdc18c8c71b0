/*

get_attachment.cpp
------------------

Resolves one attachment of a message in an offline mailbox directory. Text is
printed inline, images are printed inline and saved, anything else is saved
under the attachments directory (~/.gmail-mcp/attachments by default, or
MAILFENCE_ATTACHMENTS_DIR).

    get_attachment <mailbox-dir> <message-id> <attachment-index>


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
    if (argc != 4)
    {
        std::cerr << "usage: " << argv[0] << " <mailbox-dir> <message-id> <attachment-index>\n";
        return EXIT_FAILURE;
    }

    auto cfg = mailfence::settings::from_environment();
    if (!cfg)
    {
        print_error(cfg.error());
        return EXIT_FAILURE;
    }

    mailfence::security::boundary_generator boundaries;
    mailfence::source::json_mail_source mailbox(argv[1]);
    mailfence::tools::mailbox_tools tools(mailbox, *cfg, boundaries);

    mailfence::tools::arguments args;
    args["messageId"] = argv[2];
    // Passed as text; the tool accepts numeric strings.
    args["attachmentIndex"] = argv[3];
    const auto res = tools.get_attachment(args);
    print_result(res);
    return res.is_error ? EXIT_FAILURE : EXIT_SUCCESS;
}
