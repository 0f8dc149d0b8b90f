/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_UTF8_HPP_INCLUDED__
#define __ZCBOR_UTF8_HPP_INCLUDED__

#include <stddef.h>

namespace zcbor
{
//  Bytes taken by the UTF-8 sequence at data_, with size_ bytes left.
//  A malformed or cut sequence counts as a single one-byte character.
inline size_t utf8_sequence_size (const unsigned char *data_, size_t size_)
{
    const unsigned char lead = data_[0];
    size_t sequence;
    if (lead < 0x80)
        return 1;
    if (lead >= 0xc2 && lead <= 0xdf)
        sequence = 2;
    else if (lead >= 0xe0 && lead <= 0xef)
        sequence = 3;
    else if (lead >= 0xf0 && lead <= 0xf4)
        sequence = 4;
    else
        return 1;

    if (sequence > size_)
        return 1;
    for (size_t i = 1; i < sequence; ++i)
        if ((data_[i] & 0xc0) != 0x80)
            return 1;
    return sequence;
}

//  Number of characters in size_ bytes of text.
inline size_t utf8_length (const char *data_, size_t size_)
{
    const unsigned char *p = reinterpret_cast<const unsigned char *> (data_);
    size_t chars = 0;
    size_t pos = 0;
    while (pos < size_) {
        pos += utf8_sequence_size (p + pos, size_ - pos);
        ++chars;
    }
    return chars;
}

//  Bytes spanned by the first chars_ characters, at most size_.
inline size_t utf8_advance (const char *data_, size_t size_, size_t chars_)
{
    const unsigned char *p = reinterpret_cast<const unsigned char *> (data_);
    size_t pos = 0;
    for (; chars_ > 0 && pos < size_; --chars_)
        pos += utf8_sequence_size (p + pos, size_ - pos);
    return pos;
}
}

#endif
