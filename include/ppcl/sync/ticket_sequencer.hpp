#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace ppcl {

using Ticket = uint64_t;

// FIFO admission for the serial link: one ticket per transaction, only the
// ticket at the head of the queue may transact.
class TicketSequencer
{
public:
    TicketSequencer() = default;

    TicketSequencer(const TicketSequencer&) = delete;
    TicketSequencer& operator=(const TicketSequencer&) = delete;

    Ticket acquire();
    void await_turn(Ticket ticket);
    void release(Ticket ticket);

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable head_changed_;
    std::deque<Ticket> queue_;
    Ticket last_ticket_ = 0;
};

// Holds the head of the queue for its lifetime. Every wire transaction goes
// through one of these so the ticket is released on all exit paths.
class TicketGuard
{
public:
    explicit TicketGuard(TicketSequencer& sequencer);
    ~TicketGuard();

    TicketGuard(const TicketGuard&) = delete;
    TicketGuard& operator=(const TicketGuard&) = delete;

    Ticket ticket() const { return ticket_; }

private:
    TicketSequencer& sequencer_;
    Ticket ticket_;
};

} // namespace ppcl
