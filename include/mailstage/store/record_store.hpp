/*

record_store.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include <mailstage/detail/result.hpp>
#include <mailstage/store/records.hpp>

namespace mailstage::store
{

/**
Durable record of send attempts and their attachment metadata.

Implementations serialize their own writes. Status updates follow the state machine of
`can_transition`; anything else is reported as `invalid_transition`.
**/
class record_store
{
public:
    virtual ~record_store() = default;

    /**
    Insert a new email record. The id and `created_at` of the draft are ignored and assigned by the store.

    @return Assigned id.
    **/
    virtual result<record_id> create_email(const email_record& draft) = 0;

    /**
    Move a pending record to a terminal state; `sent` also stamps `sent_at`.
    **/
    virtual result_void update_status(record_id id, email_status status) = 0;

    /// All records, most recent first.
    virtual result<std::vector<email_record>> list_emails() = 0;

    virtual result<std::optional<email_record>> find_email(record_id id) = 0;

    virtual result<record_id> create_attachment(const attachment_record& draft) = 0;

    virtual result<std::vector<attachment_record>> attachments_for(record_id email_id) = 0;

    /// @return Number of removed attachment records.
    virtual result<std::size_t> delete_attachments(record_id email_id) = 0;
};

} // namespace mailstage::store
