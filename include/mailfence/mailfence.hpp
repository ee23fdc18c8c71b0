#pragma once

#include <mailfence/settings.hpp>

#include <mailfence/codec/base64.hpp>

#include <mailfence/security/boundary.hpp>
#include <mailfence/security/field_sanitizer.hpp>
#include <mailfence/security/filename.hpp>
#include <mailfence/security/preamble.hpp>

#include <mailfence/mime/extract.hpp>
#include <mailfence/mime/html.hpp>
#include <mailfence/mime/part.hpp>
#include <mailfence/mime/records.hpp>

#include <mailfence/attachment/classifier.hpp>
#include <mailfence/attachment/store.hpp>
#include <mailfence/attachment/types.hpp>

#include <mailfence/response/assembler.hpp>
#include <mailfence/response/content.hpp>

#include <mailfence/source/json_mail_source.hpp>
#include <mailfence/source/mail_source.hpp>

#include <mailfence/tools/arguments.hpp>
#include <mailfence/tools/mailbox_tools.hpp>
