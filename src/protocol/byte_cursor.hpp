/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_BYTE_CURSOR_HPP_INCLUDED__
#define __ZCBOR_BYTE_CURSOR_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "utils/macros.hpp"

namespace zcbor
{
struct i_source;

//  Sequential, position-tracking reader over a byte source. Bytes are
//  pulled from the source in blocks of bufsize_ bytes.
//
//  Reads return 0 on success and -1 with errno set on failure.
//  ZCBOR_ETRUNCATED means the source ended before the requested bytes
//  arrived. After any failure the cursor must not be reused.
class byte_cursor_t
{
  public:
    byte_cursor_t (i_source &source_, size_t bufsize_);
    ~byte_cursor_t ();

    //  Returns 1 and stores the byte, or 0 at end of input. Once the
    //  source is exhausted every later call returns 0 again.
    int next_byte (unsigned char &byte_);

    int read_uint8 (uint8_t &value_);
    int read_uint16 (uint16_t &value_);
    int read_uint32 (uint32_t &value_);
    int read_uint64 (uint64_t &value_);

    //  Appends exactly size_ bytes. Storage grows as data arrives.
    int read_bytes (size_t size_, std::vector<unsigned char> &bytes_);

    //  Reads exactly size_ bytes as text. Encoding is not validated.
    int read_string (size_t size_, std::string &text_);

    //  Number of bytes consumed so far.
    uint64_t offset () const { return _offset; }

    bool eof () const { return _eof; }

  private:
    //  Makes at least one unread byte available. Returns 1, 0 at end of
    //  input, -1 if the source failed.
    int fill ();

    int read_fixed (unsigned char *dest_, size_t size_);

    template <typename T> int read_append (size_t size_, T &out_);

    i_source &_source;
    std::vector<unsigned char> _buf;
    size_t _pos;
    size_t _end;
    uint64_t _offset;
    bool _eof;

    ZCBOR_NON_COPYABLE_NOR_MOVABLE (byte_cursor_t)
};
}

#endif
