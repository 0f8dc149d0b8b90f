/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/lexer.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/utf8.hpp"

#include <algorithm>
#include <utility>

namespace
{
//  Upper bound for storage reserved from a declared array count, so a
//  short input cannot force a large allocation.
const uint32_t max_reserved_elements = 256;

//  Chunk sizes: bytes for byte strings, characters for text strings.
uint32_t chunk_size (const zcbor::bytes_t &chunk_)
{
    return static_cast<uint32_t> (chunk_.size ());
}

uint32_t chunk_size (const std::string &chunk_)
{
    return static_cast<uint32_t> (
      zcbor::utf8_length (chunk_.data (), chunk_.size ()));
}
}

zcbor::lexer_t::lexer_t (i_source &source_, const options_t &options_) :
    _options (options_),
    _cursor (source_, options_.read_buffer_size),
    _reader (_cursor, _stack, _options),
    _depth (0),
    _errno (0)
{
}

zcbor::lexer_t::~lexer_t ()
{
}

int zcbor::lexer_t::read_next (token_t &token_)
{
    if (unlikely (_errno != 0)) {
        errno = _errno;
        return -1;
    }

    token_t token;
    const int rc = _reader.next_token (token);
    if (rc == -1)
        return fail (errno);
    if (rc == 0) {
        zcbor_assert (_stack.empty ());
        return 0;
    }

    if (assemble (token) == -1)
        return -1;

    zcbor_assert (_stack.empty () && _depth == 0);
    token_ = std::move (token);
    return 1;
}

int zcbor::lexer_t::read_value (value_t &value_)
{
    token_t token;
    const int rc = read_next (token);
    if (rc != 1)
        return rc;

    value_ = value_of (token);
    return 1;
}

int zcbor::lexer_t::assemble (token_t &token_)
{
    int rc = 1;

    switch (token_.kind) {
        case kind_int:
        case kind_bytes:
        case kind_string:
        case kind_bool:
        case kind_float:
        case kind_null:
        case kind_undefined:
            return 1;

        case kind_bytes_array:
            if (enter () == -1)
                return -1;
            rc = read_chunks<bytes_t> (kind_bytes, kind_bytes_array_end,
                                       token_);
            leave ();
            return rc;

        case kind_string_array:
            if (enter () == -1)
                return -1;
            rc = read_chunks<std::string> (kind_string, kind_string_array_end,
                                           token_);
            leave ();
            return rc;

        case kind_array:
            if (enter () == -1)
                return -1;
            rc = token_.size ? read_definite_array (token_)
                             : read_indefinite_array (token_);
            leave ();
            return rc;

        case kind_array_end:
        case kind_bytes_array_end:
        case kind_string_array_end:
            //  A break where an item must start, e.g. inside a definite
            //  array nested in an indefinite one.
            ZCBOR_DBG_LEXER ("%s where an item must start",
                             kind_name (token_.kind));
            return fail (ZCBOR_EBREAK);
    }

    zcbor_assert (false);
    return -1;
}

template <typename T>
int zcbor::lexer_t::read_chunks (kind_t chunk_kind_,
                                 kind_t end_kind_,
                                 token_t &token_)
{
    T data;
    std::vector<uint32_t> chunks;

    for (;;) {
        token_t chunk;
        const int rc = _reader.next_token (chunk);
        if (rc == -1)
            return fail (errno);
        if (rc == 0)
            return end_of_input ();

        if (chunk.kind == end_kind_)
            break;

        if (unlikely (chunk.kind != chunk_kind_)) {
            ZCBOR_DBG_LEXER ("%s chunk inside %s", kind_name (chunk.kind),
                             kind_name (token_.kind));
            return fail (ZCBOR_EMIXED);
        }

        const T &part = boost::get<T> (*chunk.value);
        if (unlikely (part.size () > _options.max_size - data.size ()))
            return fail (ZCBOR_ESIZE);

        data.insert (data.end (), part.begin (), part.end ());
        chunks.push_back (chunk_size (part));
    }

    ZCBOR_DBG_LEXER ("%s of %zu bytes in %zu chunks", kind_name (token_.kind),
                     data.size (), chunks.size ());

    token_.kind = chunk_kind_;
    token_.value = value_t (std::move (data));
    token_.chunks = std::move (chunks);
    return 1;
}

int zcbor::lexer_t::read_definite_array (token_t &token_)
{
    const uint32_t count = *token_.size;

    array_t elements;
    elements.reserve (std::min (count, max_reserved_elements));

    for (uint32_t i = 0; i < count; ++i) {
        value_t element;
        if (read_element (element) == -1)
            return -1;
        elements.push_back (std::move (element));
    }

    token_.value = value_t (std::move (elements));
    return 1;
}

int zcbor::lexer_t::read_indefinite_array (token_t &token_)
{
    array_t elements;

    //  The next header decides: the matching break ends the array,
    //  anything else starts an element.
    for (;;) {
        token_t header;
        const int rc = _reader.next_token (header);
        if (rc == -1)
            return fail (errno);
        if (rc == 0)
            return end_of_input ();

        if (header.kind == kind_array_end)
            break;

        if (assemble (header) == -1)
            return -1;
        elements.push_back (value_of (header));
    }

    token_.value = value_t (std::move (elements));
    return 1;
}

int zcbor::lexer_t::read_element (value_t &value_)
{
    token_t header;
    const int rc = _reader.next_token (header);
    if (rc == -1)
        return fail (errno);
    if (rc == 0)
        return end_of_input ();

    if (assemble (header) == -1)
        return -1;

    value_ = value_of (header);
    return 0;
}

int zcbor::lexer_t::enter ()
{
    if (unlikely (_depth >= _options.max_depth)) {
        ZCBOR_DBG_LEXER ("depth limit %d reached", _options.max_depth);
        return fail (ZCBOR_EDEPTH);
    }
    ++_depth;
    return 0;
}

void zcbor::lexer_t::leave ()
{
    --_depth;
}

int zcbor::lexer_t::end_of_input ()
{
    //  Only a missing break leaves a construct open; otherwise the input
    //  stopped short of a declared array count.
    return fail (_stack.empty () ? ZCBOR_ETRUNCATED : ZCBOR_EEOF);
}

int zcbor::lexer_t::fail (int errno_)
{
    ZCBOR_LOG_ERROR ("%s (header at %llu, offset %llu, depth %zu)",
                     zcbor::errno_to_string (errno_),
                     static_cast<unsigned long long> (token_offset ()),
                     static_cast<unsigned long long> (offset ()),
                     _stack.depth ());
    _errno = errno_;
    errno = errno_;
    return -1;
}
