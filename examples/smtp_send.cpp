/*

smtp_send.cpp
-------------

Sends a message with one attachment through an SMTP relay using STARTTLS.

Usage: smtp_send <host> <from> <to> [file]
SMTP_USERNAME and SMTP_PASSWORD are used for AUTH when set.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mailstage/mailstage.hpp>
#include "example_util.hpp"


using mailstage::mime::outbound_attachment;
using mailstage::mime::outbound_message;
using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    if (argc < 4)
    {
        cout << "usage: " << argv[0] << " <host> <from> <to> [file]" << endl;
        return EXIT_FAILURE;
    }

    mailstage::log::logger::instance().set_trace_enabled(true);

    mailstage::smtp::options options;
    options.host = argv[1];
    options.tls_mode = mailstage::net::tls_mode::starttls;
    options.tls.verify = mailstage::net::verify_mode::peer;
    if (const char* user = std::getenv("SMTP_USERNAME"))
        options.username = user;
    if (const char* pass = std::getenv("SMTP_PASSWORD"))
        options.password = pass;

    outbound_message msg;
    msg.from = argv[2];
    msg.to = {argv[3]};
    msg.subject = "mailstage smtp example";
    msg.text = "Hello from mailstage.";
    msg.html = "<p>Hello from <b>mailstage</b>.</p>";

    if (argc > 4)
    {
        const std::filesystem::path file = argv[4];
        auto bytes = mailstage::upload::read_file(file);
        if (!bytes)
        {
            print_error(bytes.error());
            return EXIT_FAILURE;
        }
        const auto resolved = mailstage::mime::resolve(file);
        outbound_attachment att;
        att.content = mailstage::base64::encode_flat(*bytes);
        att.filename = resolved.display_filename;
        att.type = resolved.content_type;
        msg.attachments.push_back(std::move(att));
    }

    mailstage::smtp::delivery delivery(options);
    auto sent = delivery.send(msg);
    if (!sent)
    {
        print_error(sent.error());
        return EXIT_FAILURE;
    }
    cout << "Message accepted." << endl;
    return EXIT_SUCCESS;
}
