/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/byte_cursor.hpp"
#include "protocol/wire.hpp"
#include "io/i_source.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

zcbor::byte_cursor_t::byte_cursor_t (i_source &source_, size_t bufsize_) :
    _source (source_),
    _buf (bufsize_ == 0                            ? 1
          : bufsize_ > ZCBOR_READ_BUFFER_SIZE_MAX ? ZCBOR_READ_BUFFER_SIZE_MAX
                                                  : bufsize_),
    _pos (0),
    _end (0),
    _offset (0),
    _eof (false)
{
}

zcbor::byte_cursor_t::~byte_cursor_t ()
{
}

int zcbor::byte_cursor_t::fill ()
{
    if (_pos < _end)
        return 1;
    if (_eof)
        return 0;

    const int rc = _source.read (&_buf[0], _buf.size ());
    if (rc < 0)
        return -1;
    if (rc == 0) {
        ZCBOR_DBG_CURSOR ("%s exhausted at offset %llu", _source.name (),
                          static_cast<unsigned long long> (_offset));
        _eof = true;
        return 0;
    }

    zcbor_assert (static_cast<size_t> (rc) <= _buf.size ());
    _pos = 0;
    _end = static_cast<size_t> (rc);
    return 1;
}

int zcbor::byte_cursor_t::next_byte (unsigned char &byte_)
{
    const int rc = fill ();
    if (rc <= 0)
        return rc;

    byte_ = _buf[_pos++];
    ++_offset;
    return 1;
}

int zcbor::byte_cursor_t::read_fixed (unsigned char *dest_, size_t size_)
{
    while (size_ > 0) {
        const int rc = fill ();
        if (rc < 0)
            return -1;
        if (rc == 0) {
            errno = ZCBOR_ETRUNCATED;
            return -1;
        }

        size_t n = _end - _pos;
        if (n > size_)
            n = size_;
        memcpy (dest_, &_buf[_pos], n);
        dest_ += n;
        size_ -= n;
        _pos += n;
        _offset += n;
    }
    return 0;
}

int zcbor::byte_cursor_t::read_uint8 (uint8_t &value_)
{
    unsigned char tmp[1];
    if (read_fixed (tmp, sizeof tmp) == -1)
        return -1;
    value_ = get_uint8 (tmp);
    return 0;
}

int zcbor::byte_cursor_t::read_uint16 (uint16_t &value_)
{
    unsigned char tmp[2];
    if (read_fixed (tmp, sizeof tmp) == -1)
        return -1;
    value_ = get_uint16 (tmp);
    return 0;
}

int zcbor::byte_cursor_t::read_uint32 (uint32_t &value_)
{
    unsigned char tmp[4];
    if (read_fixed (tmp, sizeof tmp) == -1)
        return -1;
    value_ = get_uint32 (tmp);
    return 0;
}

int zcbor::byte_cursor_t::read_uint64 (uint64_t &value_)
{
    unsigned char tmp[8];
    if (read_fixed (tmp, sizeof tmp) == -1)
        return -1;
    value_ = get_uint64 (tmp);
    return 0;
}

template <typename T>
int zcbor::byte_cursor_t::read_append (size_t size_, T &out_)
{
    while (size_ > 0) {
        const int rc = fill ();
        if (rc < 0)
            return -1;
        if (rc == 0) {
            errno = ZCBOR_ETRUNCATED;
            return -1;
        }

        size_t n = _end - _pos;
        if (n > size_)
            n = size_;
        out_.insert (out_.end (), _buf.begin () + _pos,
                     _buf.begin () + _pos + n);
        size_ -= n;
        _pos += n;
        _offset += n;
    }
    return 0;
}

int zcbor::byte_cursor_t::read_bytes (size_t size_,
                                      std::vector<unsigned char> &bytes_)
{
    return read_append (size_, bytes_);
}

int zcbor::byte_cursor_t::read_string (size_t size_, std::string &text_)
{
    return read_append (size_, text_);
}
