#pragma once

// This header includes the CMake-generated export header
// and provides the CLOUDSPEND_API macro used on exported symbols

#include "cloudspend/cloudspend_export.h"

#ifndef CLOUDSPEND_API
    #define CLOUDSPEND_API CLOUDSPEND_EXPORT
#endif
