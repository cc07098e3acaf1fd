#include "voxlink/util/completion_signal.h"

namespace voxlink::util
{

CompletionSignal::CompletionSignal () : raised (false), generation (0) {}

void
CompletionSignal::set ()
{
    {
        std::lock_guard lk (this->m);
        this->raised = true;
    }

    this->cv.notify_all ();
}

void
CompletionSignal::clear ()
{
    {
        std::lock_guard lk (this->m);
        this->raised = false;
        this->generation++;
    }

    this->cv.notify_all ();
}

void
CompletionSignal::cancel ()
{
    {
        std::lock_guard lk (this->m);
        this->generation++;
    }

    this->cv.notify_all ();
}

bool
CompletionSignal::is_set ()
{
    std::lock_guard lk (this->m);
    return this->raised;
}

wait_status_e
CompletionSignal::wait_for (std::chrono::milliseconds timeout)
{
    std::unique_lock lk (this->m);

    if (this->raised)
        return WAIT_RAISED;

    const uint64_t gen = this->generation;

    const bool woke = this->cv.wait_for (lk, timeout, [this, gen] () {
        return this->raised || this->generation != gen;
    });

    if (!woke)
        return WAIT_TIMEOUT;

    if (this->raised)
        return WAIT_RAISED;

    return WAIT_CANCELLED;
}

} // voxlink::util
