/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_LEXER_HPP_INCLUDED__
#define __ZCBOR_LEXER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "core/options.hpp"
#include "protocol/byte_cursor.hpp"
#include "protocol/construct_stack.hpp"
#include "protocol/token.hpp"
#include "protocol/token_reader.hpp"
#include "utils/macros.hpp"

namespace zcbor
{
struct i_source;

//  One decode session over one source. Assembles header tokens into
//  complete items: chunked strings are concatenated and arrays, definite
//  or indefinite, are read recursively.
//
//  Both read functions return 1 when an item was produced, 0 on a clean
//  end of input between top-level items, and -1 with errno set on error.
//  An error is final: every later call fails with the same errno.
class lexer_t
{
  public:
    explicit lexer_t (i_source &source_,
                      const options_t &options_ = options_t ());
    ~lexer_t ();

    //  Next assembled item as a token. Null and undefined keep their
    //  kinds; chunked strings carry their chunk sizes.
    int read_next (token_t &token_);

    //  Next assembled item as a value. Null and undefined both yield
    //  null_t.
    int read_value (value_t &value_);

    //  Indefinite-length constructs currently open.
    size_t depth () const { return _stack.depth (); }

    uint64_t offset () const { return _cursor.offset (); }

    //  Offset of the last header read; locates the failing header after
    //  an error.
    uint64_t token_offset () const { return _reader.token_offset (); }

    //  errno of the error that ended the session, 0 if none.
    int error () const { return _errno; }

  private:
    //  Completes the item whose header is in token_.
    int assemble (token_t &token_);

    template <typename T>
    int read_chunks (kind_t chunk_kind_, kind_t end_kind_, token_t &token_);

    int read_definite_array (token_t &token_);
    int read_indefinite_array (token_t &token_);

    //  Reads a header that must start an item and assembles it.
    int read_element (value_t &value_);

    int enter ();
    void leave ();

    //  Input ended inside an item.
    int end_of_input ();

    int fail (int errno_);

    const options_t _options;
    byte_cursor_t _cursor;
    construct_stack_t _stack;
    token_reader_t _reader;

    //  Aggregates being assembled, definite ones included.
    int _depth;
    int _errno;

    ZCBOR_NON_COPYABLE_NOR_MOVABLE (lexer_t)
};
}

#endif
