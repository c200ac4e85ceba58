#include "Version.h"

#ifndef ARNOLDSWEEP_VERSION
#define ARNOLDSWEEP_VERSION "0.0.0-dev"
#endif

namespace ArnoldSweep {

const char* getVersion()
{
    return ARNOLDSWEEP_VERSION;
}

} // namespace ArnoldSweep
