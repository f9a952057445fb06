/*

outbound_message.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <vector>

namespace mailstage::mime
{

struct outbound_attachment
{
    /// File bytes, base64 encoded without line breaks.
    std::string content;
    std::string filename;
    /// Media type, e.g. `application/pdf`.
    std::string type;
    std::string disposition = "attachment";
};

/**
Message handed to a delivery collaborator.

Addresses are bare `local@domain` strings. Both bodies are UTF-8; an empty one is left out of the
rendered document.
**/
struct outbound_message
{
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string text;
    std::string html;
    std::vector<outbound_attachment> attachments;
};

} // namespace mailstage::mime
