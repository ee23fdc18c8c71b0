/*

json_mail_source.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Offline mail_source over a directory of mail service JSON documents:

    <root>/messages/<id>.json                       one message, full format
    <root>/labels.json                              {"labels": [...]}
    <root>/attachments/<messageId>/<attId>.json     {"size": n, "data": "<base64url>"}

*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/error_detail.hpp>
#include <mailfence/detail/log.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/mime/part.hpp>
#include <mailfence/source/mail_source.hpp>

namespace mailfence::source
{

class json_mail_source : public mail_source
{
public:
    explicit json_mail_source(std::filesystem::path root)
        : root_(std::move(root)),
          messages_dir_(root_ / "messages"),
          attachments_dir_(root_ / "attachments")
    {
    }

    result<std::vector<std::string>> list_message_ids(std::string_view query, int max_results) override
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(messages_dir_, ec))
            return fail<std::vector<std::string>>(errc::source_unavailable, "mailbox directory not found",
                detail::error_detail().add_path("path", messages_dir_).str());

        struct candidate
        {
            std::string id;
            std::int64_t internal_date = 0;
        };
        std::vector<candidate> matches;

        const auto terms = split_query(query);
        for (const auto& de : std::filesystem::directory_iterator(messages_dir_, ec))
        {
            std::error_code entry_ec;
            if (!de.is_regular_file(entry_ec) || de.path().extension() != ".json")
                continue;

            auto doc = read_json(de.path());
            if (!doc)
            {
                MAILFENCE_WARN("skipping unreadable message file " + de.path().filename().string());
                continue;
            }
            auto msg = doc->get<mime::mail_message>();
            if (msg.id.empty())
                msg.id = de.path().stem().string();
            if (!matches_query(msg, terms))
                continue;

            matches.push_back({msg.id, internal_date(*doc)});
        }
        if (ec)
            return fail<std::vector<std::string>>(errc::source_unavailable, "cannot list mailbox",
                detail::error_detail().add_ec("ec", ec).str());

        std::sort(matches.begin(), matches.end(), [](const candidate& a, const candidate& b)
        {
            if (a.internal_date != b.internal_date)
                return a.internal_date > b.internal_date;
            return a.id < b.id;
        });

        std::vector<std::string> ids;
        for (auto& m : matches)
        {
            if (max_results >= 0 && ids.size() >= static_cast<std::size_t>(max_results))
                break;
            ids.push_back(std::move(m.id));
        }
        return ids;
    }

    result<mime::mail_message> get_message(std::string_view id, message_format format) override
    {
        if (!is_safe_name(id))
            return fail<mime::mail_message>(errc::invalid_argument, "Invalid messageId");

        const auto path = messages_dir_ / (std::string(id) + ".json");
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return fail<mime::mail_message>(errc::message_not_found, "Message not found: " + std::string(id));

        auto doc = MAILFENCE_TRY(read_json(path));

        auto msg = doc.get<mime::mail_message>();
        if (msg.id.empty())
            msg.id = std::string(id);
        if (format == message_format::metadata && msg.payload)
        {
            msg.payload->parts.clear();
            msg.payload->body.reset();
        }
        return msg;
    }

    result<std::vector<mime::mail_label>> list_labels() override
    {
        const auto path = root_ / "labels.json";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return std::vector<mime::mail_label>{};

        auto doc = MAILFENCE_TRY(read_json(path));

        std::vector<mime::mail_label> labels;
        if (auto it = doc.find("labels"); it != doc.end() && it->is_array())
        {
            for (const auto& l : *it)
            {
                if (l.is_object())
                    labels.push_back(l.get<mime::mail_label>());
            }
        }
        return labels;
    }

    result<std::optional<std::string>> fetch_attachment_data(std::string_view message_id,
        std::string_view attachment_id) override
    {
        if (!is_safe_name(message_id) || !is_safe_name(attachment_id))
            return fail<std::optional<std::string>>(errc::invalid_argument, "Invalid attachment reference");

        const auto path = attachments_dir_ / std::string(message_id) / (std::string(attachment_id) + ".json");
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return std::optional<std::string>{};

        auto doc = MAILFENCE_TRY(read_json(path));

        auto it = doc.find("data");
        if (it == doc.end() || !it->is_string())
            return std::optional<std::string>{};
        return std::optional<std::string>(it->get<std::string>());
    }

private:
    struct query_terms
    {
        std::vector<std::string> labels;
        std::vector<std::string> words;
    };

    static bool is_safe_name(std::string_view name) noexcept
    {
        return !name.empty() && name.find('/') == std::string_view::npos
            && name.find('\\') == std::string_view::npos && name.find("..") == std::string_view::npos;
    }

    static query_terms split_query(std::string_view query)
    {
        query_terms terms;
        std::size_t pos = 0;
        while (pos < query.size())
        {
            while (pos < query.size() && query[pos] == ' ')
                ++pos;
            const auto end = std::min(query.find(' ', pos), query.size());
            if (end > pos)
            {
                auto word = detail::to_lower_copy(query.substr(pos, end - pos));
                if (word.rfind("label:", 0) == 0)
                    terms.labels.push_back(word.substr(6));
                else
                    terms.words.push_back(std::move(word));
            }
            pos = end;
        }
        return terms;
    }

    static bool matches_query(const mime::mail_message& msg, const query_terms& terms)
    {
        for (const auto& label : terms.labels)
        {
            if (!msg.label_ids)
                return false;
            const bool has = std::any_of(msg.label_ids->begin(), msg.label_ids->end(),
                [&label](const std::string& id) { return detail::iequals_ascii(id, label); });
            if (!has)
                return false;
        }

        if (terms.words.empty())
            return true;

        std::string haystack = msg.snippet.value_or("");
        if (msg.payload)
        {
            for (const char* name : {"Subject", "From"})
                haystack += "\n" + msg.payload->header_value(name).value_or("");
        }
        haystack = detail::to_lower_copy(haystack);

        return std::all_of(terms.words.begin(), terms.words.end(),
            [&haystack](const std::string& w) { return haystack.find(w) != std::string::npos; });
    }

    static std::int64_t internal_date(const nlohmann::json& doc)
    {
        auto it = doc.find("internalDate");
        if (it == doc.end())
            return 0;
        if (it->is_number_integer())
            return it->get<std::int64_t>();
        if (it->is_string())
        {
            try
            {
                return std::stoll(it->get<std::string>());
            }
            catch (const std::exception&)
            {
                return 0;
            }
        }
        return 0;
    }

    static result<nlohmann::json> read_json(const std::filesystem::path& path)
    {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return fail<nlohmann::json>(errc::source_unavailable, "cannot open mail data",
                detail::error_detail().add_path("path", path).str());

        auto doc = nlohmann::json::parse(ifs, nullptr, false);
        if (doc.is_discarded())
            return fail<nlohmann::json>(errc::source_unavailable, "malformed mail data",
                detail::error_detail().add_path("path", path).str());
        return doc;
    }

    std::filesystem::path root_;
    std::filesystem::path messages_dir_;
    std::filesystem::path attachments_dir_;
};

} // namespace mailfence::source
