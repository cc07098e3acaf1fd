#include "voxlink/voxlink.h"

int
main (int argc, const char *argv[])
{
    return voxlink::run (argc, argv);
}
