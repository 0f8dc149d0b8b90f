/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>
#include <limits.h>
#include <cstdlib>

#include "core/options.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

namespace
{
int option_invalid ()
{
    errno = EINVAL;
    return -1;
}

template <typename T>
int do_setopt (const void *const optval_,
               const size_t optvallen_,
               T *const out_value_)
{
    if (optval_ && optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return option_invalid ();
}

int do_getopt_int (void *const optval_, size_t *const optvallen_, int value_)
{
    if (!optval_ || !optvallen_ || *optvallen_ < sizeof (int))
        return option_invalid ();
    memcpy (optval_, &value_, sizeof (int));
    *optvallen_ = sizeof (int);
    return 0;
}

size_t parse_size_env (const char *name_, size_t fallback_)
{
    const char *env = std::getenv (name_);
    if (!env || !*env)
        return fallback_;
    errno = 0;
    char *end = NULL;
    const unsigned long long value = std::strtoull (env, &end, 10);
    if (errno != 0 || end == env || *end != '\0' || value == 0) {
        ZCBOR_GLOBAL_WARN ("ignoring %s=%s", name_, env);
        return fallback_;
    }
    return static_cast<size_t> (value);
}
}

zcbor::options_t::options_t () :
    max_size (ZCBOR_MAX_SIZE_DFLT),
    max_depth (ZCBOR_MAX_DEPTH_DFLT),
    read_buffer_size (ZCBOR_READ_BUFFER_SIZE_DFLT)
{
}

zcbor::options_t zcbor::options_t::from_env ()
{
    options_t options;

    const size_t max_size =
      parse_size_env ("ZCBOR_MAX_SIZE", ZCBOR_MAX_SIZE_DFLT);
    options.max_size = max_size > ZCBOR_MAX_SIZE_DFLT
                         ? ZCBOR_MAX_SIZE_DFLT
                         : static_cast<uint32_t> (max_size);

    const size_t max_depth =
      parse_size_env ("ZCBOR_MAX_DEPTH", ZCBOR_MAX_DEPTH_DFLT);
    options.max_depth = max_depth > INT_MAX ? INT_MAX
                                            : static_cast<int> (max_depth);

    const size_t read_buffer_size =
      parse_size_env ("ZCBOR_READ_BUFFER_SIZE", ZCBOR_READ_BUFFER_SIZE_DFLT);
    if (read_buffer_size > ZCBOR_READ_BUFFER_SIZE_MAX) {
        ZCBOR_GLOBAL_WARN ("ignoring ZCBOR_READ_BUFFER_SIZE=%zu above %d",
                           read_buffer_size, ZCBOR_READ_BUFFER_SIZE_MAX);
        options.read_buffer_size = ZCBOR_READ_BUFFER_SIZE_DFLT;
    } else
        options.read_buffer_size = read_buffer_size;
    return options;
}

int zcbor::options_t::setopt (int option_,
                              const void *optval_,
                              size_t optvallen_)
{
    int value = 0;
    if (do_setopt (optval_, optvallen_, &value) == -1)
        return -1;

    switch (option_) {
        case ZCBOR_MAX_SIZE:
            if (value <= 0)
                return option_invalid ();
            max_size = static_cast<uint32_t> (value);
            return 0;

        case ZCBOR_MAX_DEPTH:
            if (value <= 0)
                return option_invalid ();
            max_depth = value;
            return 0;

        case ZCBOR_READ_BUFFER_SIZE:
            if (value <= 0 || value > ZCBOR_READ_BUFFER_SIZE_MAX)
                return option_invalid ();
            read_buffer_size = static_cast<size_t> (value);
            return 0;

        default:
            return option_invalid ();
    }
}

int zcbor::options_t::getopt (int option_,
                              void *optval_,
                              size_t *optvallen_) const
{
    switch (option_) {
        case ZCBOR_MAX_SIZE:
            return do_getopt_int (optval_, optvallen_,
                                  static_cast<int> (max_size));

        case ZCBOR_MAX_DEPTH:
            return do_getopt_int (optval_, optvallen_, max_depth);

        case ZCBOR_READ_BUFFER_SIZE:
            if (read_buffer_size > INT_MAX)
                return do_getopt_int (optval_, optvallen_, INT_MAX);
            return do_getopt_int (optval_, optvallen_,
                                  static_cast<int> (read_buffer_size));

        default:
            return option_invalid ();
    }
}
