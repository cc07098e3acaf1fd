#include "voxlink/cmds.h"
#include <iostream>

namespace voxlink::command
{

std::string
run_guarded (const std::string &command_name,
             const std::function<void (std::string &)> &body)
{
    std::string out;

    try
        {
            body (out);
        }
    catch (const exception &e)
        {
            std::cerr << "[command::run_guarded ERROR] " << command_name
                      << ": " << e.what () << '\n';

            out = std::string ("`[ERROR]` ") + e.what ();
        }
    catch (const std::exception &e)
        {
            std::cerr << "[command::run_guarded ERROR] Unexpected error in "
                      << command_name << ": " << e.what () << '\n';

            out = "`[ERROR]` Something went wrong";
        }

    if (out.empty ())
        out = "Done";

    return out;
}

} // voxlink::command
