/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/macros.hpp"
#include "utils/err.hpp"

void zcbor_version (int *major_, int *minor_, int *patch_)
{
    *major_ = ZCBOR_VERSION_MAJOR;
    *minor_ = ZCBOR_VERSION_MINOR;
    *patch_ = ZCBOR_VERSION_PATCH;
}

const char *zcbor_strerror (int errnum_)
{
    return zcbor::errno_to_string (errnum_);
}

int zcbor_errno (void)
{
    return errno;
}
