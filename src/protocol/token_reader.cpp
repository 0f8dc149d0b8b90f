/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/token_reader.hpp"
#include "protocol/byte_cursor.hpp"
#include "protocol/cbor_protocol.hpp"
#include "protocol/construct_stack.hpp"
#include "protocol/wire.hpp"
#include "core/options.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <limits>

namespace
{
//  One rung of the widening ladder: S when -(m+1) fits, Wider otherwise.
template <typename S, typename Wider, typename U>
zcbor::integer_t negate_or_widen (U magnitude_)
{
    if (magnitude_ <= static_cast<U> (std::numeric_limits<S>::max ()))
        return zcbor::integer_t (
          static_cast<S> (-static_cast<S> (magnitude_) - 1));
    return zcbor::integer_t (
      static_cast<Wider> (-static_cast<Wider> (magnitude_) - 1));
}

struct negate_visitor_t : public boost::static_visitor<zcbor::integer_t>
{
    template <typename T>
    zcbor::integer_t operator() (const T &magnitude_) const
    {
        return zcbor::negative_integer (magnitude_);
    }

    //  read_argument only yields unsigned widths.
    zcbor::integer_t operator() (const int8_t &) const { return invalid (); }
    zcbor::integer_t operator() (const int16_t &) const { return invalid (); }
    zcbor::integer_t operator() (const int32_t &) const { return invalid (); }
    zcbor::integer_t operator() (const int64_t &) const { return invalid (); }
    zcbor::integer_t operator() (const zcbor::int128_t &) const
    {
        return invalid ();
    }

    static zcbor::integer_t invalid ()
    {
        zcbor_assert (false);
        return zcbor::integer_t ();
    }
};

struct size_visitor_t : public boost::static_visitor<uint64_t>
{
    uint64_t operator() (uint8_t size_) const { return size_; }
    uint64_t operator() (uint16_t size_) const { return size_; }
    uint64_t operator() (uint32_t size_) const { return size_; }
    uint64_t operator() (uint64_t size_) const { return size_; }

    template <typename T> uint64_t operator() (const T &) const
    {
        zcbor_assert (false);
        return 0;
    }
};
}

zcbor::integer_t zcbor::negative_integer (uint8_t magnitude_)
{
    return negate_or_widen<int8_t, int16_t> (magnitude_);
}

zcbor::integer_t zcbor::negative_integer (uint16_t magnitude_)
{
    return negate_or_widen<int16_t, int32_t> (magnitude_);
}

zcbor::integer_t zcbor::negative_integer (uint32_t magnitude_)
{
    return negate_or_widen<int32_t, int64_t> (magnitude_);
}

zcbor::integer_t zcbor::negative_integer (uint64_t magnitude_)
{
    return negate_or_widen<int64_t, int128_t> (magnitude_);
}

zcbor::token_reader_t::token_reader_t (byte_cursor_t &cursor_,
                                       construct_stack_t &stack_,
                                       const options_t &options_) :
    _cursor (cursor_),
    _stack (stack_),
    _options (options_),
    _token_offset (0)
{
}

int zcbor::token_reader_t::next_token (token_t &token_)
{
    _token_offset = _cursor.offset ();

    unsigned char byte;
    const int rc = _cursor.next_byte (byte);
    if (rc <= 0)
        return rc;

    ZCBOR_DBG_TOKEN ("header 0x%02x at %llu", byte,
                     static_cast<unsigned long long> (_token_offset));

    token_ = token_t ();
    switch (cbor_major_type (byte)) {
        case cbor_major_unsigned:
            return read_unsigned (byte, token_);
        case cbor_major_negative:
            return read_negative (byte, token_);
        case cbor_major_bytes:
            return read_bytes (byte, token_);
        case cbor_major_text:
            return read_string (byte, token_);
        case cbor_major_array:
            return read_array (byte, token_);
        case cbor_major_simple:
            return read_simple (byte, token_);
        default:
            //  Maps and tags are not decoded.
            return unsupported (byte);
    }
}

int zcbor::token_reader_t::read_argument (unsigned char byte_,
                                          integer_t &argument_)
{
    const uint8_t info = cbor_additional_info (byte_);
    if (info < cbor_info_uint8) {
        argument_ = info;
        return 0;
    }

    switch (info) {
        case cbor_info_uint8: {
            uint8_t value;
            if (_cursor.read_uint8 (value) == -1)
                return -1;
            argument_ = value;
            return 0;
        }
        case cbor_info_uint16: {
            uint16_t value;
            if (_cursor.read_uint16 (value) == -1)
                return -1;
            argument_ = value;
            return 0;
        }
        case cbor_info_uint32: {
            uint32_t value;
            if (_cursor.read_uint32 (value) == -1)
                return -1;
            argument_ = value;
            return 0;
        }
        case cbor_info_uint64: {
            uint64_t value;
            if (_cursor.read_uint64 (value) == -1)
                return -1;
            argument_ = value;
            return 0;
        }
        default:
            return unsupported (byte_);
    }
}

int zcbor::token_reader_t::read_size (unsigned char byte_, uint32_t &size_)
{
    integer_t argument;
    if (read_argument (byte_, argument) == -1)
        return -1;

    const uint64_t size = boost::apply_visitor (size_visitor_t (), argument);
    if (unlikely (size > _options.max_size)) {
        ZCBOR_DBG_TOKEN ("size %llu above limit %u",
                         static_cast<unsigned long long> (size),
                         _options.max_size);
        errno = ZCBOR_ESIZE;
        return -1;
    }
    size_ = static_cast<uint32_t> (size);
    return 0;
}

int zcbor::token_reader_t::read_unsigned (unsigned char byte_,
                                          token_t &token_)
{
    integer_t value;
    if (read_argument (byte_, value) == -1)
        return -1;

    token_.kind = kind_int;
    token_.value = value_t (value);
    return 1;
}

int zcbor::token_reader_t::read_negative (unsigned char byte_,
                                          token_t &token_)
{
    integer_t magnitude;
    if (read_argument (byte_, magnitude) == -1)
        return -1;

    token_.kind = kind_int;
    token_.value =
      value_t (boost::apply_visitor (negate_visitor_t (), magnitude));
    return 1;
}

int zcbor::token_reader_t::read_bytes (unsigned char byte_, token_t &token_)
{
    if (cbor_additional_info (byte_) == cbor_info_indefinite)
        return open_construct (kind_bytes_array, token_);

    uint32_t size;
    if (read_size (byte_, size) == -1)
        return -1;

    bytes_t bytes;
    if (_cursor.read_bytes (size, bytes) == -1)
        return -1;

    token_.kind = kind_bytes;
    token_.value = value_t (bytes);
    return 1;
}

int zcbor::token_reader_t::read_string (unsigned char byte_, token_t &token_)
{
    if (cbor_additional_info (byte_) == cbor_info_indefinite)
        return open_construct (kind_string_array, token_);

    uint32_t size;
    if (read_size (byte_, size) == -1)
        return -1;

    std::string text;
    if (_cursor.read_string (size, text) == -1)
        return -1;

    token_.kind = kind_string;
    token_.value = value_t (text);
    return 1;
}

int zcbor::token_reader_t::read_array (unsigned char byte_, token_t &token_)
{
    if (cbor_additional_info (byte_) == cbor_info_indefinite)
        return open_construct (kind_array, token_);

    uint32_t count;
    if (read_size (byte_, count) == -1)
        return -1;

    token_.kind = kind_array;
    token_.size = count;
    return 1;
}

int zcbor::token_reader_t::read_simple (unsigned char byte_, token_t &token_)
{
    switch (byte_) {
        case cbor_false:
        case cbor_true:
            token_.kind = kind_bool;
            token_.value = value_t (byte_ == cbor_true);
            return 1;

        case cbor_null:
            token_.kind = kind_null;
            return 1;

        case cbor_undefined:
            token_.kind = kind_undefined;
            return 1;

        case cbor_float16: {
            uint16_t bits;
            if (_cursor.read_uint16 (bits) == -1)
                return -1;
            token_.kind = kind_float;
            token_.value =
              value_t (float_from_bits (half_to_float_bits (bits)));
            return 1;
        }

        case cbor_float32: {
            uint32_t bits;
            if (_cursor.read_uint32 (bits) == -1)
                return -1;
            token_.kind = kind_float;
            token_.value = value_t (float_from_bits (bits));
            return 1;
        }

        case cbor_float64: {
            uint64_t bits;
            if (_cursor.read_uint64 (bits) == -1)
                return -1;
            token_.kind = kind_float;
            token_.value = value_t (double_from_bits (bits));
            return 1;
        }

        case cbor_break:
            return close_construct (token_);

        default:
            //  Simple values other than the above are not decoded.
            return unsupported (byte_);
    }
}

int zcbor::token_reader_t::open_construct (kind_t kind_, token_t &token_)
{
    _stack.push (kind_);
    ZCBOR_DBG_TOKEN ("open %s, depth %zu", kind_name (kind_), _stack.depth ());

    token_.kind = kind_;
    return 1;
}

int zcbor::token_reader_t::close_construct (token_t &token_)
{
    kind_t opened;
    if (_stack.pop (opened) == -1) {
        ZCBOR_DBG_TOKEN ("break at %llu with nothing open",
                         static_cast<unsigned long long> (_token_offset));
        errno = ZCBOR_EBREAK;
        return -1;
    }

    switch (opened) {
        case kind_array:
            token_.kind = kind_array_end;
            break;
        case kind_bytes_array:
            token_.kind = kind_bytes_array_end;
            break;
        case kind_string_array:
            token_.kind = kind_string_array_end;
            break;
        default:
            errno = ZCBOR_EBREAK;
            return -1;
    }

    ZCBOR_DBG_TOKEN ("break closes %s, depth %zu", kind_name (opened),
                     _stack.depth ());
    return 1;
}

int zcbor::token_reader_t::unsupported (unsigned char byte_)
{
    ZCBOR_DBG_TOKEN ("unsupported leading byte 0x%02x at %llu", byte_,
                     static_cast<unsigned long long> (_token_offset));
    LIBZCBOR_UNUSED (byte_);
    errno = ZCBOR_EBADBYTE;
    return -1;
}
