/*

delivery_client.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <mailstage/detail/result.hpp>
#include <mailstage/mime/outbound_message.hpp>

namespace mailstage::delivery
{

/**
Hands a composed message to whatever transports it further.

`send` blocks until the provider accepted or refused the message. Failures are reported with a
`delivery_*` code whose detail carries the provider's own explanation.
**/
class delivery_client
{
public:
    virtual ~delivery_client() = default;

    virtual result_void send(const mime::outbound_message& msg) = 0;
};

} // namespace mailstage::delivery
