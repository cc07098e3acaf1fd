#ifndef VOXLINK_UTIL_COMPLETION_SIGNAL_H
#define VOXLINK_UTIL_COMPLETION_SIGNAL_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace voxlink::util
{

enum wait_status_e
{
    WAIT_RAISED,
    WAIT_TIMEOUT,
    // clear () or cancel () happened while waiting
    WAIT_CANCELLED,
};

/**
 * @brief Resettable one-shot signal. Once raised every wait returns
 * immediately until clear (). Each clear ()/cancel () starts a new
 * generation, waiters from an older generation wake up with WAIT_CANCELLED
 * instead of sleeping until their deadline.
 */
class CompletionSignal
{
    std::mutex m;
    std::condition_variable cv;
    bool raised;
    uint64_t generation;

  public:
    CompletionSignal ();

    void set ();

    /**
     * @brief Reset to not raised, waking current waiters
     */
    void clear ();

    /**
     * @brief Wake current waiters without changing the raised state
     */
    void cancel ();

    bool is_set ();

    wait_status_e wait_for (std::chrono::milliseconds timeout);
};

} // voxlink::util

#endif // VOXLINK_UTIL_COMPLETION_SIGNAL_H
