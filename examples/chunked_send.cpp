/*

chunked_send.cpp
----------------

Uploads a file in chunks, assembles it and mails it as an attachment into a local Maildir.

Usage: chunked_send <file> [maildir]


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <mailstage/delivery/maildir_delivery.hpp>
#include <mailstage/service/mail_service.hpp>
#include <mailstage/store/memory_record_store.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include "example_util.hpp"


using mailstage::delivery::maildir_delivery;
using mailstage::service::chunk_request;
using mailstage::service::complete_request;
using mailstage::service::mail_service;
using mailstage::store::memory_record_store;
using mailstage::upload::chunk_store;
using std::cout;
using std::endl;
using std::string;


int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        cout << "usage: " << argv[0] << " <file> [maildir]" << endl;
        return EXIT_FAILURE;
    }

    const std::filesystem::path source = argv[1];
    auto bytes = mailstage::upload::read_file(source);
    if (!bytes)
    {
        print_error(bytes.error());
        return EXIT_FAILURE;
    }

    chunk_store chunks(std::filesystem::temp_directory_path() / "mailstage_example");
    memory_record_store records;
    maildir_delivery maildir(argc > 2 ? argv[2] : "maildir");
    mail_service service(chunks, records, maildir);

    // Four chunks, sent last to first to show that arrival order does not matter.
    constexpr std::size_t chunk_size_divisor = 4;
    const std::size_t chunk_size = std::max<std::size_t>(1, (bytes->size() + chunk_size_divisor - 1) / chunk_size_divisor);
    const std::size_t total = std::max<std::size_t>(1, (bytes->size() + chunk_size - 1) / chunk_size);
    const string upload_id = "example-" + std::to_string(std::rand());
    const string file_name = source.filename().string();

    for (std::size_t i = total; i-- > 0;)
    {
        chunk_request chunk;
        chunk.upload_id = upload_id;
        chunk.file_name = file_name;
        chunk.chunk_index = static_cast<std::int64_t>(i);
        chunk.total_chunks = static_cast<std::int64_t>(total);
        chunk.bytes = std::string_view(*bytes).substr(std::min(i * chunk_size, bytes->size()), chunk_size);
        auto receipt = service.receive_chunk(chunk);
        if (!receipt)
        {
            print_error(receipt.error());
            return EXIT_FAILURE;
        }
        cout << "Chunk " << receipt->chunk_index + 1 << " of " << receipt->total_chunks << " received" << endl;
    }

    complete_request complete;
    complete.upload_id = upload_id;
    complete.file_name = file_name;
    complete.total_chunks = static_cast<std::int64_t>(total);
    auto staged = service.complete_upload(complete);
    if (!staged)
    {
        print_error(staged.error());
        return EXIT_FAILURE;
    }
    cout << "Assembled " << staged->file_path << " (" << staged->mime_type << ")" << endl;

    mailstage::pipeline::send_request req;
    req.sender = "mailstage@example.com";
    req.recipients = {"someone@example.com"};
    req.subject = "chunked upload";
    req.body = "The file is attached.";
    req.attachments = {staged->file_path};
    auto email_id = service.send(req);
    if (!email_id)
    {
        print_error(email_id.error());
        return EXIT_FAILURE;
    }

    auto rec = service.get_email(*email_id);
    if (rec)
        cout << "Email " << rec->id << " is " << mailstage::store::status_to_string(rec->status) << endl;
    for (const auto& path : maildir.list_new())
        cout << "Delivered: " << path << endl;
    return EXIT_SUCCESS;
}
