/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_TOKEN_HPP_INCLUDED__
#define __ZCBOR_TOKEN_HPP_INCLUDED__

#include <stdint.h>

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "protocol/value.hpp"

namespace zcbor
{
enum kind_t
{
    kind_int,
    kind_bytes,
    kind_string,
    kind_bool,
    kind_float,
    kind_null,
    kind_undefined,
    kind_array,
    kind_array_end,
    kind_bytes_array,
    kind_bytes_array_end,
    kind_string_array,
    kind_string_array_end
};

const char *kind_name (kind_t kind_);

//  Kinds that open an indefinite-length construct.
inline bool is_opener (kind_t kind_)
{
    return kind_ == kind_array || kind_ == kind_bytes_array
           || kind_ == kind_string_array;
}

//  One decoded header, or one fully assembled item.
//
//  Payload by kind:
//    int         value holds an integer_t
//    bytes       value holds bytes_t, chunks set if it was chunked
//    string      value holds std::string, chunks set if it was chunked
//    bool/float  value holds bool/double
//    array       size holds the declared count (unset if indefinite);
//                once assembled, value holds the array_t
//    all others  no payload
struct token_t
{
    token_t () : kind (kind_null) {}
    explicit token_t (kind_t kind_) : kind (kind_) {}

    kind_t kind;
    boost::optional<value_t> value;
    boost::optional<uint32_t> size;
    boost::optional<std::vector<uint32_t> > chunks;
};

//  Payload as a value; null and undefined both yield null_t.
value_t value_of (const token_t &token_);

//  Diagnostic notation that keeps what a value loses: undefined,
//  indefinite arrays as [_ ...] and chunk boundaries as (_ ...).
std::string to_diagnostic (const token_t &token_);
}

#endif
