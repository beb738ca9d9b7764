#pragma once

#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/detail/retry.hpp>

#include <mailvault/codec/base64.hpp>
#include <mailvault/codec/encoded_word.hpp>
#include <mailvault/codec/quoted_printable.hpp>

#include <mailvault/mime/entity.hpp>

#include <mailvault/net/dialog.hpp>
#include <mailvault/net/tls_mode.hpp>
#include <mailvault/net/upgradable_stream.hpp>

#include <mailvault/imap/types.hpp>
#include <mailvault/imap/client.hpp>

// Archive engine
#include <mailvault/archive/profile.hpp>
#include <mailvault/archive/types.hpp>
#include <mailvault/archive/report.hpp>
#include <mailvault/archive/retention.hpp>
#include <mailvault/archive/materializer.hpp>
#include <mailvault/archive/imap_transport.hpp>
#include <mailvault/archive/storage_backends.hpp>
#include <mailvault/archive/orchestrator.hpp>

// Configuration
#include <mailvault/config/profile_loader.hpp>
