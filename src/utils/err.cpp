/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *zcbor::errno_to_string (int errno_)
{
    switch (errno_) {
        case ZCBOR_ETRUNCATED:
            return "Input truncated before the declared length";
        case ZCBOR_ESIZE:
            return "Declared length exceeds the maximum size";
        case ZCBOR_EBADBYTE:
            return "Unsupported leading byte";
        case ZCBOR_EBREAK:
            return "Break without an open indefinite-length item";
        case ZCBOR_EMIXED:
            return "Chunk type does not match the enclosing string";
        case ZCBOR_EEOF:
            return "Unexpected end of input inside an open item";
        case ZCBOR_EDEPTH:
            return "Nesting depth exceeds the maximum depth";
        default:
#if defined _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
            return strerror (errno_);
#if defined _MSC_VER
#pragma warning(pop)
#endif
    }
}

void zcbor::zcbor_abort (const char *errmsg_)
{
    LIBZCBOR_UNUSED (errmsg_);
    abort ();
}
