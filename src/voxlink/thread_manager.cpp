#include "voxlink/thread_manager.h"
#include "voxlink/voxlink.h"

#include <deque>
#include <iostream>
#include <mutex>
#include <stdio.h>
#include <thread>

namespace voxlink
{
namespace thread_manager
{
std::mutex _ns_mutex;
std::deque<thread_data> _threads = {};

DoneSetter::~DoneSetter () { set_done (); }

void
print_total_thread ()
{
    fprintf (stderr, "[thread_manager] Active worker threads: %zu\n",
             _threads.size ());
}

void
dispatch (std::thread &t)
{
    if (!get_running_state ())
        {
            std::cerr << "[thread_manager::dispatch WARN] Exiting, detaching "
                         "worker thread "
                      << t.get_id () << '\n';

            t.detach ();
            return;
        }

    const bool debug = get_debug_state ();
    std::lock_guard lk (_ns_mutex);

    if (debug)
        std::cerr << "[thread_manager::dispatch] Worker spawned: "
                  << t.get_id () << '\n';

    _threads.push_back ({ std::move (t), false });

    if (debug)
        print_total_thread ();
}

void
set_done ()
{
    std::lock_guard lk (_ns_mutex);

    const auto id = std::this_thread::get_id ();

    for (thread_data &td : _threads)
        {
            if (td.t.get_id () != id)
                continue;

            td.done = true;
            break;
        }

    if (get_debug_state ())
        std::cerr << "[thread_manager::set_done] Worker done: " << id << '\n';
}

void
join_done ()
{
    std::lock_guard lk (_ns_mutex);

    size_t joined = 0;
    auto i = _threads.begin ();

    while (i != _threads.end ())
        {
            if (!i->done)
                {
                    i++;
                    continue;
                }

            if (i->t.joinable ())
                {
                    i->t.join ();
                    joined++;
                }

            i = _threads.erase (i);
        }

    if (joined && get_debug_state ())
        {
            fprintf (stderr, "[thread_manager::join_done] Joined %zu\n",
                     joined);
            print_total_thread ();
        }
}

void
join_all ()
{
    // unlocked around join so exiting workers can still call set_done
    _ns_mutex.lock ();

    if (get_debug_state ())
        fprintf (stderr, "[thread_manager::join_all] Joining %zu workers\n",
                 _threads.size ());

    while (!_threads.empty ())
        {
            std::thread t = std::move (_threads.front ().t);
            _threads.pop_front ();

            if (!t.joinable ())
                continue;

            _ns_mutex.unlock ();
            t.join ();
            _ns_mutex.lock ();
        }

    _ns_mutex.unlock ();
}

} // thread_manager
} // voxlink
