/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_I_SOURCE_HPP_INCLUDED__
#define __ZCBOR_I_SOURCE_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace zcbor
{
//  Interface to be implemented by byte sources feeding a decode session.

struct i_source
{
    virtual ~i_source () ZCBOR_DEFAULT;

    //  Copies up to size_ bytes into buffer_ and returns the number of bytes
    //  copied. Blocks until at least one byte is available. Returns 0 once
    //  the source is exhausted, -1 with errno set if the source failed.
    virtual int read (unsigned char *buffer_, size_t size_) = 0;

    virtual const char *name () const = 0;
};
}

#endif
