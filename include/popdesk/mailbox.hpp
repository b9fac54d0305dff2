#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <popdesk/message.hpp>

namespace popdesk
{

/// Message count and total size, as reported by the server
struct mailbox_stat
{
    std::size_t messages_no = 0;
    std::uint64_t mailbox_size = 0;
};

/**
Client view of the mailbox as of the last successful refresh.

Published once, never modified afterwards. `messages` is ordered by sequence
number and its size equals `message_count`.
**/
struct mailbox_snapshot
{
    std::size_t message_count = 0;
    std::uint64_t mailbox_size = 0;
    std::vector<message> messages;

    [[nodiscard]] const message* find(unsigned sequence_number) const noexcept
    {
        for (const auto& msg : messages)
            if (msg.sequence_number() == sequence_number)
                return &msg;
        return nullptr;
    }

    [[nodiscard]] bool empty() const noexcept { return messages.empty(); }
};

} // namespace popdesk
