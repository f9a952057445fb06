#pragma once

#include <mailstage/detail/result.hpp>
#include <mailstage/detail/log.hpp>

#include <mailstage/codec/base64.hpp>
#include <mailstage/codec/percent.hpp>

#include <mailstage/upload/staging.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include <mailstage/upload/chunk_assembler.hpp>

#include <mailstage/mime/attachment_resolver.hpp>
#include <mailstage/mime/outbound_message.hpp>
#include <mailstage/mime/composer.hpp>

#include <mailstage/store/records.hpp>
#include <mailstage/store/record_store.hpp>
#include <mailstage/store/memory_record_store.hpp>
#include <mailstage/store/sqlite_record_store.hpp>

#include <mailstage/delivery/delivery_client.hpp>
#include <mailstage/delivery/maildir_delivery.hpp>
#include <mailstage/smtp/types.hpp>
#include <mailstage/smtp/error_mapping.hpp>
#include <mailstage/smtp/delivery.hpp>

#include <mailstage/pipeline/send_pipeline.hpp>

#include <mailstage/service/config.hpp>
#include <mailstage/service/mail_service.hpp>
