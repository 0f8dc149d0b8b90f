/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_WIRE_HPP_INCLUDED__
#define __ZCBOR_WIRE_HPP_INCLUDED__

#include <stdint.h>
#include <string.h>

namespace zcbor
{
//  Helper functions to convert different integer types to/from network
//  byte order.

inline uint8_t get_uint8 (const unsigned char *buffer_)
{
    return *buffer_;
}

inline uint16_t get_uint16 (const unsigned char *buffer_)
{
    return (static_cast<uint16_t> (buffer_[0]) << 8)
           | static_cast<uint16_t> (buffer_[1]);
}

inline uint32_t get_uint32 (const unsigned char *buffer_)
{
    return (static_cast<uint32_t> (buffer_[0]) << 24)
           | (static_cast<uint32_t> (buffer_[1]) << 16)
           | (static_cast<uint32_t> (buffer_[2]) << 8)
           | static_cast<uint32_t> (buffer_[3]);
}

inline uint64_t get_uint64 (const unsigned char *buffer_)
{
    return (static_cast<uint64_t> (buffer_[0]) << 56)
           | (static_cast<uint64_t> (buffer_[1]) << 48)
           | (static_cast<uint64_t> (buffer_[2]) << 40)
           | (static_cast<uint64_t> (buffer_[3]) << 32)
           | (static_cast<uint64_t> (buffer_[4]) << 24)
           | (static_cast<uint64_t> (buffer_[5]) << 16)
           | (static_cast<uint64_t> (buffer_[6]) << 8)
           | static_cast<uint64_t> (buffer_[7]);
}

//  Expands IEEE 754 binary16 bits to binary32 bits. Subnormals are
//  normalised, infinities and NaN payloads are preserved.
inline uint32_t half_to_float_bits (uint16_t half_)
{
    const uint32_t sign = static_cast<uint32_t> (half_ & 0x8000u) << 16;
    uint32_t exp = (half_ >> 10) & 0x1fu;
    uint32_t frac = half_ & 0x03ffu;

    if (exp == 0) {
        if (frac == 0)
            return sign;

        int shift = 0;
        while ((frac & 0x0400u) == 0) {
            frac <<= 1;
            ++shift;
        }
        frac &= 0x03ffu;
        exp = static_cast<uint32_t> (127 - 15 - shift + 1);
        return sign | (exp << 23) | (frac << 13);
    }

    if (exp == 31)
        return sign | 0x7f800000u | (frac << 13);

    return sign | ((exp + 127 - 15) << 23) | (frac << 13);
}

inline double float_from_bits (uint32_t bits_)
{
    float value;
    memcpy (&value, &bits_, sizeof value);
    return static_cast<double> (value);
}

inline double double_from_bits (uint64_t bits_)
{
    double value;
    memcpy (&value, &bits_, sizeof value);
    return value;
}
}

#endif
