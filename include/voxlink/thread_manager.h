#ifndef VOXLINK_THREAD_MANAGER_H
#define VOXLINK_THREAD_MANAGER_H

#include <deque>
#include <thread>

namespace voxlink
{
namespace thread_manager
{

struct thread_data
{
    std::thread t;
    bool done;
};

/**
 * @brief Marks the current thread done when going out of scope, the main
 * loop joins it afterwards
 */
struct DoneSetter
{
    DoneSetter () = default;
    ~DoneSetter ();
};

void print_total_thread ();

/**
 * @brief Take ownership of t, detaches it instead when the program is
 * exiting
 */
void dispatch (std::thread &t);

void set_done ();

void join_done ();

void join_all ();

} // thread_manager
} // voxlink

#endif // VOXLINK_THREAD_MANAGER_H
