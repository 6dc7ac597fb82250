#include "cloudspend/cloudspend.h"
#include <cstdio>

namespace cloudspend {

const char* GetVersionString() {
    static char version[32];
    snprintf(version, sizeof(version), "%d.%d.%d",
             CLOUDSPEND_VERSION_MAJOR,
             CLOUDSPEND_VERSION_MINOR,
             CLOUDSPEND_VERSION_PATCH);
    return version;
}

} // namespace cloudspend
