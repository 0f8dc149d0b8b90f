/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_CBOR_PROTOCOL_HPP_INCLUDED__
#define __ZCBOR_CBOR_PROTOCOL_HPP_INCLUDED__

#include <stdint.h>

namespace zcbor
{
//  Initial byte layout: major type in the top three bits, additional
//  information in the low five.
enum
{
    cbor_major_shift = 5,
    cbor_info_mask = 0x1f,

    cbor_info_uint8 = 24,
    cbor_info_uint16 = 25,
    cbor_info_uint32 = 26,
    cbor_info_uint64 = 27,
    cbor_info_indefinite = 31
};

enum
{
    cbor_major_unsigned = 0,
    cbor_major_negative = 1,
    cbor_major_bytes = 2,
    cbor_major_text = 3,
    cbor_major_array = 4,
    cbor_major_map = 5,
    cbor_major_tag = 6,
    cbor_major_simple = 7
};

//  Major type 7 values.
enum
{
    cbor_false = 0xf4,
    cbor_true = 0xf5,
    cbor_null = 0xf6,
    cbor_undefined = 0xf7,
    cbor_float16 = 0xf9,
    cbor_float32 = 0xfa,
    cbor_float64 = 0xfb,
    cbor_break = 0xff
};

inline uint8_t cbor_major_type (uint8_t byte_)
{
    return byte_ >> cbor_major_shift;
}

inline uint8_t cbor_additional_info (uint8_t byte_)
{
    return byte_ & cbor_info_mask;
}
}

#endif
