/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_OPTIONS_HPP_INCLUDED__
#define __ZCBOR_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace zcbor
{
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Defaults overridden by ZCBOR_MAX_SIZE, ZCBOR_MAX_DEPTH and
    //  ZCBOR_READ_BUFFER_SIZE from the environment.
    static options_t from_env ();

    //  Largest byte/text string length or array count accepted.
    //  Never above ZCBOR_MAX_SIZE_DFLT.
    uint32_t max_size;

    //  Maximum number of aggregates open at the same time.
    int max_depth;

    //  Size of the read-ahead block pulled from the source, at most
    //  ZCBOR_READ_BUFFER_SIZE_MAX.
    size_t read_buffer_size;
};
}

#endif
