/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "io/buffer_source.hpp"

#include <climits>

zcbor::buffer_source_t::buffer_source_t (const void *data_, size_t size_) :
    _data (static_cast<const unsigned char *> (data_)),
    _size (data_ ? size_ : 0),
    _pos (0)
{
}

int zcbor::buffer_source_t::read (unsigned char *buffer_, size_t size_)
{
    size_t n = _size - _pos;
    if (n > size_)
        n = size_;
    if (n > static_cast<size_t> (INT_MAX))
        n = static_cast<size_t> (INT_MAX);
    if (n > 0) {
        memcpy (buffer_, _data + _pos, n);
        _pos += n;
    }
    return static_cast<int> (n);
}
