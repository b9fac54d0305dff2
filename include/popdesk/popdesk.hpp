#pragma once

#include <popdesk/detail/log.hpp>
#include <popdesk/detail/result.hpp>

#include <popdesk/credentials.hpp>
#include <popdesk/host_directory.hpp>
#include <popdesk/mailbox.hpp>
#include <popdesk/message.hpp>
#include <popdesk/transport.hpp>

#include <popdesk/net/dialog.hpp>

#include <popdesk/pop3/types.hpp>
#include <popdesk/pop3/error_mapping.hpp>
#include <popdesk/pop3/transport.hpp>

#include <popdesk/session.hpp>
