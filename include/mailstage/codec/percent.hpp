/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <mailstage/detail/result.hpp>


namespace mailstage
{


/**
Percent decoding of URL query components (RFC 3986 section 2.1).

The form encoding `+` for a space is honored, since browsers send query strings that way.
**/
class percent
{
public:

    /**
    Decoding a percent encoded query component.

    @param text Component as found in the request target.
    @return     Decoded bytes, or `validation_failed` on a truncated or non hexadecimal escape.
    **/
    [[nodiscard]] static result<std::string> decode(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (std::string_view::size_type i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (ch == PERCENT_HEX_FLAG)
            {
                if (i + 2 >= text.size())
                    return fail<std::string>(error_code::validation_failed, "Truncated percent escape.", std::string(text));
                const int hi = hex_digit_to_int(text[i + 1]);
                const int lo = hex_digit_to_int(text[i + 2]);
                if (hi < 0 || lo < 0)
                    return fail<std::string>(error_code::validation_failed, "Bad percent escape.", std::string(text));
                out += static_cast<char>((hi << 4) + lo);
                i += 2;
            }
            else if (ch == '+')
                out += ' ';
            else
                out += ch;
        }
        return out;
    }

private:

    static constexpr char PERCENT_HEX_FLAG = '%';

    static constexpr int hex_digit_to_int(char digit) noexcept
    {
        if (digit >= '0' && digit <= '9')
            return digit - '0';
        if (digit >= 'a' && digit <= 'f')
            return digit - 'a' + 10;
        if (digit >= 'A' && digit <= 'F')
            return digit - 'A' + 10;
        return -1;
    }
};


} // namespace mailstage
