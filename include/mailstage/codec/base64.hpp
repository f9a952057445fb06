/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <mailstage/detail/result.hpp>


namespace mailstage
{


/**
Base64 codec (RFC 4648 alphabet, `=` padding).

Attachments travel base64 encoded inside the outbound message; the MIME composer re-wraps them
into lines of the configured length.
**/
class base64
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Line length recommended by RFC 2045 for MIME bodies.
    **/
    static constexpr std::string::size_type MIME_LINE_POLICY = 76;

    /**
    No line splitting.
    **/
    static constexpr std::string::size_type NO_LINE_POLICY = 0;

    /**
    Setting the line policy.

    Since Base64 encodes three characters into four, the split is made after a multiple of four
    characters so that clients merging the lines see whole quanta.

    @param line_policy Maximum characters per line, zero for a single line.
    **/
    explicit base64(std::string::size_type line_policy = NO_LINE_POLICY)
        : line_policy_(line_policy - line_policy % SEXTETS_NO)
    {
    }

    /**
    Encoding bytes into Base64 lines by applying the line policy.

    @param text Bytes to encode.
    @return     Encoded lines, a single one when no policy is set.
    **/
    [[nodiscard]] std::vector<std::string> encode(std::string_view text) const
    {
        return wrap(encode_flat(text));
    }

    /**
    Splitting an already encoded string into lines by applying the line policy.
    **/
    [[nodiscard]] std::vector<std::string> wrap(std::string_view encoded) const
    {
        std::vector<std::string> lines;
        if (line_policy_ == 0)
        {
            lines.emplace_back(encoded);
            return lines;
        }
        for (std::string::size_type pos = 0; pos < encoded.size(); pos += line_policy_)
            lines.emplace_back(encoded.substr(pos, line_policy_));
        return lines;
    }

    /**
    Encoding bytes into one unbroken Base64 string.
    **/
    [[nodiscard]] static std::string encode_flat(std::string_view text)
    {
        std::string out;
        out.reserve(((text.size() + 2) / OCTETS_NO) * SEXTETS_NO);

        std::string::size_type i = 0;
        for (; i + OCTETS_NO <= text.size(); i += OCTETS_NO)
        {
            const auto o0 = static_cast<unsigned char>(text[i]);
            const auto o1 = static_cast<unsigned char>(text[i + 1]);
            const auto o2 = static_cast<unsigned char>(text[i + 2]);
            out += CHARSET[(o0 & 0xfc) >> 2];
            out += CHARSET[((o0 & 0x03) << 4) + ((o1 & 0xf0) >> 4)];
            out += CHARSET[((o1 & 0x0f) << 2) + ((o2 & 0xc0) >> 6)];
            out += CHARSET[o2 & 0x3f];
        }

        const auto rest = text.size() - i;
        if (rest == 1)
        {
            const auto o0 = static_cast<unsigned char>(text[i]);
            out += CHARSET[(o0 & 0xfc) >> 2];
            out += CHARSET[(o0 & 0x03) << 4];
            out += "==";
        }
        else if (rest == 2)
        {
            const auto o0 = static_cast<unsigned char>(text[i]);
            const auto o1 = static_cast<unsigned char>(text[i + 1]);
            out += CHARSET[(o0 & 0xfc) >> 2];
            out += CHARSET[((o0 & 0x03) << 4) + ((o1 & 0xf0) >> 4)];
            out += CHARSET[(o1 & 0x0f) << 2];
            out += '=';
        }
        return out;
    }

    /**
    Decoding a Base64 string; CR and LF between quanta are skipped.

    @param text Encoded text.
    @return     Decoded bytes or `validation_failed` on a character outside the alphabet or a
                truncated quantum.
    **/
    [[nodiscard]] static result<std::string> decode(std::string_view text)
    {
        const auto& table = decode_table();
        std::string out;
        out.reserve(text.size() / SEXTETS_NO * OCTETS_NO);

        unsigned char sextets[SEXTETS_NO];
        int count = 0;
        int padding = 0;
        for (char ch : text)
        {
            if (ch == '\r' || ch == '\n')
                continue;
            if (ch == '=')
            {
                sextets[count++] = 0;
                ++padding;
            }
            else
            {
                if (padding > 0)
                    return fail<std::string>(error_code::validation_failed, "Base64 data after padding.");
                const unsigned char value = table[static_cast<unsigned char>(ch)];
                if (value == INVALID)
                    return fail<std::string>(error_code::validation_failed, "Bad character in Base64 data.");
                sextets[count++] = value;
            }

            if (count == SEXTETS_NO)
            {
                if (padding > 2)
                    return fail<std::string>(error_code::validation_failed, "Bad Base64 padding.");
                out += static_cast<char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
                if (padding < 2)
                    out += static_cast<char>(((sextets[1] & 0x0f) << 4) + ((sextets[2] & 0x3c) >> 2));
                if (padding < 1)
                    out += static_cast<char>(((sextets[2] & 0x03) << 6) + sextets[3]);
                count = 0;
            }
        }

        if (count != 0)
            return fail<std::string>(error_code::validation_failed, "Truncated Base64 data.");
        return out;
    }

private:

    static constexpr int OCTETS_NO = 3;
    static constexpr int SEXTETS_NO = 4;
    static constexpr unsigned char INVALID = 0xff;

    static const std::array<unsigned char, 256>& decode_table()
    {
        static const std::array<unsigned char, 256> table = []
        {
            std::array<unsigned char, 256> t{};
            t.fill(INVALID);
            for (std::string::size_type i = 0; i < CHARSET.size(); ++i)
                t[static_cast<unsigned char>(CHARSET[i])] = static_cast<unsigned char>(i);
            return t;
        }();
        return table;
    }

    std::string::size_type line_policy_;
};


} // namespace mailstage
