/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_TOKEN_READER_HPP_INCLUDED__
#define __ZCBOR_TOKEN_READER_HPP_INCLUDED__

#include <stdint.h>

#include "protocol/token.hpp"
#include "utils/macros.hpp"

namespace zcbor
{
class byte_cursor_t;
class construct_stack_t;
struct options_t;

//  Decodes one CBOR header per call, dispatching on the leading byte.
//  Indefinite-length openers are pushed on the construct stack and break
//  bytes pop it, so the reader yields ArrayEnd, BytesArrayEnd or
//  StringArrayEnd depending on what the break closes.
class token_reader_t
{
  public:
    token_reader_t (byte_cursor_t &cursor_,
                    construct_stack_t &stack_,
                    const options_t &options_);

    //  Returns 1 with the token filled in, 0 at end of input before a
    //  header byte, -1 with errno set on malformed or truncated input.
    int next_token (token_t &token_);

    //  Offset of the leading byte of the last header read.
    uint64_t token_offset () const { return _token_offset; }

  private:
    //  Decodes the argument of a header: the low five bits when below 24,
    //  otherwise a 1, 2, 4 or 8 byte big-endian number. The integer keeps
    //  the width it was encoded with.
    int read_argument (unsigned char byte_, integer_t &argument_);

    //  Like read_argument, for lengths and counts bounded by max_size.
    int read_size (unsigned char byte_, uint32_t &size_);

    int read_unsigned (unsigned char byte_, token_t &token_);
    int read_negative (unsigned char byte_, token_t &token_);
    int read_bytes (unsigned char byte_, token_t &token_);
    int read_string (unsigned char byte_, token_t &token_);
    int read_array (unsigned char byte_, token_t &token_);
    int read_simple (unsigned char byte_, token_t &token_);

    int open_construct (kind_t kind_, token_t &token_);
    int close_construct (token_t &token_);

    int unsupported (unsigned char byte_);

    byte_cursor_t &_cursor;
    construct_stack_t &_stack;
    const options_t &_options;
    uint64_t _token_offset;

    ZCBOR_NON_COPYABLE_NOR_MOVABLE (token_reader_t)
};

//  -(m+1) for a negative integer magnitude m, in the narrowest signed
//  type of m's width, promoted along 8 -> 16 -> 32 -> 64 -> 128 bits when
//  negating m would overflow that type.
integer_t negative_integer (uint8_t magnitude_);
integer_t negative_integer (uint16_t magnitude_);
integer_t negative_integer (uint32_t magnitude_);
integer_t negative_integer (uint64_t magnitude_);
}

#endif
