/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <limits>
#include <string>
#include <string_view>
#include <vector>
#include <mailfence/detail/result.hpp>


namespace mailfence
{


/**
Base64 codec over the standard (RFC 4648 section 4) or URL-safe (section 5) alphabet.

Mail service payloads arrive as unpadded base64url; inline image payloads leave as padded standard base64 on a
single line, so by default lines are not split.
**/
class base64
{
public:

    enum class alphabet_t {STANDARD, URL_SAFE};

    /**
    Line length policies, in encoded characters.
    **/
    static constexpr std::string::size_type LINE_RECOMMENDED = 76;
    static constexpr std::string::size_type LINE_UNLIMITED = std::numeric_limits<std::string::size_type>::max();

    static constexpr char CR_CHAR = '\r';
    static constexpr char LF_CHAR = '\n';
    static constexpr char EQUAL_CHAR = '=';

    /**
    Standard Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    URL and filename safe Base64 character set.
    **/
    inline static const std::string CHARSET_URL{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"};

    /**
    Setting the alphabet and line policies.

    Since Base64 encodes three characters into four, the split is made after each fourth character, so the line policies
    are rounded down to be divisible by four.

    @param alphabet     Alphabet used by both encoder and decoder.
    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    explicit base64(alphabet_t alphabet = alphabet_t::STANDARD, std::string::size_type line1_policy = LINE_UNLIMITED,
        std::string::size_type lines_policy = LINE_UNLIMITED)
        : alphabet_(alphabet), line1_policy_(line1_policy), lines_policy_(lines_policy)
    {
        line1_policy_ -= line1_policy_ % SEXTETS_NO;
        lines_policy_ -= lines_policy_ % SEXTETS_NO;
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Encoding binary data into lines of Base64 text by applying the line policy. The last group is always padded.

    @param data Bytes to encode.
    @return     Encoded lines.
    **/
    std::vector<std::string> encode(std::string_view data) const
    {
        const std::string& charset = chars();
        std::vector<std::string> enc_text;
        std::string line;
        std::string::size_type policy = line1_policy_;

        auto push_char = [&](char ch)
        {
            if (line.size() >= policy)
            {
                enc_text.push_back(std::move(line));
                line.clear();
                policy = lines_policy_;
            }
            line += ch;
        };

        std::string::size_type pos = 0;
        while (pos + OCTETS_NO <= data.size())
        {
            const auto o0 = static_cast<unsigned char>(data[pos]);
            const auto o1 = static_cast<unsigned char>(data[pos + 1]);
            const auto o2 = static_cast<unsigned char>(data[pos + 2]);
            push_char(charset[(o0 & 0xfc) >> 2]);
            push_char(charset[((o0 & 0x03) << 4) + ((o1 & 0xf0) >> 4)]);
            push_char(charset[((o1 & 0x0f) << 2) + ((o2 & 0xc0) >> 6)]);
            push_char(charset[o2 & 0x3f]);
            pos += OCTETS_NO;
        }

        const std::string::size_type remaining = data.size() - pos;
        if (remaining > 0)
        {
            const auto o0 = static_cast<unsigned char>(data[pos]);
            const auto o1 = remaining > 1 ? static_cast<unsigned char>(data[pos + 1]) : 0;
            push_char(charset[(o0 & 0xfc) >> 2]);
            push_char(charset[((o0 & 0x03) << 4) + ((o1 & 0xf0) >> 4)]);
            if (remaining > 1)
                push_char(charset[(o1 & 0x0f) << 2]);
            else
                push_char(EQUAL_CHAR);
            push_char(EQUAL_CHAR);
        }

        if (!line.empty())
            enc_text.push_back(std::move(line));

        return enc_text;
    }

    /**
    Encoding binary data into a single Base64 string regardless of the line policy.

    @param data Bytes to encode.
    @return     Encoded string.
    **/
    std::string encode_line(std::string_view data) const
    {
        std::string out;
        out.reserve((data.size() + 2) / OCTETS_NO * SEXTETS_NO);
        for (auto& line : encode(data))
            out += line;
        return out;
    }

    /**
    Decoding Base64 text. Line breaks are skipped and trailing padding is optional.

    @param text Encoded text.
    @return     Decoded bytes, or `codec_invalid_input` on a character outside the alphabet, data after padding or a
                dangling sextet.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size() / SEXTETS_NO * OCTETS_NO + OCTETS_NO);
        unsigned char sextets[SEXTETS_NO];
        int count = 0;
        bool padding_seen = false;

        for (char ch : text)
        {
            if (ch == CR_CHAR || ch == LF_CHAR)
                continue;
            if (ch == EQUAL_CHAR)
            {
                padding_seen = true;
                continue;
            }
            if (padding_seen)
                return fail<std::string>(errc::codec_invalid_input, "Base64 data after padding.");

            const int value = sextet_of(ch);
            if (value < 0)
                return fail<std::string>(errc::codec_invalid_input, "Bad character `" + std::string(1, ch) + "`.");

            sextets[count++] = static_cast<unsigned char>(value);
            if (count == SEXTETS_NO)
            {
                dec_text += static_cast<char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
                dec_text += static_cast<char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
                dec_text += static_cast<char>(((sextets[2] & 0x3) << 6) + sextets[3]);
                count = 0;
            }
        }

        if (count == 1)
            return fail<std::string>(errc::codec_invalid_input, "Truncated Base64 group.");
        if (count >= 2)
            dec_text += static_cast<char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
        if (count == 3)
            dec_text += static_cast<char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));

        return dec_text;
    }

private:

    const std::string& chars() const
    {
        return alphabet_ == alphabet_t::URL_SAFE ? CHARSET_URL : CHARSET;
    }

    int sextet_of(char ch) const
    {
        if (ch >= 'A' && ch <= 'Z')
            return ch - 'A';
        if (ch >= 'a' && ch <= 'z')
            return ch - 'a' + 26;
        if (ch >= '0' && ch <= '9')
            return ch - '0' + 52;
        if (alphabet_ == alphabet_t::URL_SAFE)
        {
            if (ch == '-')
                return 62;
            if (ch == '_')
                return 63;
        }
        else
        {
            if (ch == '+')
                return 62;
            if (ch == '/')
                return 63;
        }
        return -1;
    }

    alphabet_t alphabet_;
    std::string::size_type line1_policy_;
    std::string::size_type lines_policy_;

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


/**
Decoding the unpadded base64url data handed out by the mail service.
**/
inline result<std::string> decode_base64url(std::string_view data)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    return b64.decode(data);
}


} // namespace mailfence
