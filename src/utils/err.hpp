/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_ERR_HPP_INCLUDED__
#define __ZCBOR_ERR_HPP_INCLUDED__

#include <assert.h>
#include <errno.h>
#include <string.h>
#include <stdlib.h>
#include <stdio.h>

#include "utils/likely.hpp"

//  zcbor-specific error codes are defined in zcbor.h

namespace zcbor
{
const char *errno_to_string (int errno_);
#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void zcbor_abort (const char *errmsg_) __attribute__ ((analyzer_noreturn));
#else
void zcbor_abort (const char *errmsg_);
#endif
#else
void zcbor_abort (const char *errmsg_);
#endif
}

//  This macro works in exactly the same way as the normal assert. It is used
//  for internal invariants only; malformed input is reported through errno.
#define zcbor_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__,   \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            zcbor::zcbor_abort (#x);                                           \
        }                                                                      \
    } while (false)

#endif
