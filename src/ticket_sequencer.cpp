#include "sync/ticket_sequencer.hpp"
#include <algorithm>

namespace ppcl {

Ticket TicketSequencer::acquire()
{
    std::lock_guard<std::mutex> lock(mutex_);
    Ticket ticket = ++last_ticket_;
    queue_.push_back(ticket);
    return ticket;
}

void TicketSequencer::await_turn(Ticket ticket)
{
    std::unique_lock<std::mutex> lock(mutex_);
    head_changed_.wait(lock, [this, ticket] {
        return !queue_.empty() && queue_.front() == ticket;
    });
}

void TicketSequencer::release(Ticket ticket)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty() && queue_.front() == ticket) {
            queue_.pop_front();
        } else {
            auto it = std::find(queue_.begin(), queue_.end(), ticket);
            if (it != queue_.end()) {
                queue_.erase(it);
            }
        }
    }
    head_changed_.notify_all();
}

size_t TicketSequencer::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

TicketGuard::TicketGuard(TicketSequencer& sequencer)
    : sequencer_(sequencer), ticket_(sequencer.acquire())
{
    sequencer_.await_turn(ticket_);
}

TicketGuard::~TicketGuard()
{
    sequencer_.release(ticket_);
}

} // namespace ppcl
