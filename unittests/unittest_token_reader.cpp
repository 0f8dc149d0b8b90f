/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"
#include "io/buffer_source.hpp"
#include "protocol/byte_cursor.hpp"
#include "protocol/construct_stack.hpp"
#include "protocol/token_reader.hpp"

#include <unity.h>
#include <cmath>
#include <limits>

void setUp ()
{
}

void tearDown ()
{
}

//  A reader with its cursor and stack over a fixed input.
struct reader_fixture_t
{
    reader_fixture_t (const unsigned char *data_,
                      size_t size_,
                      const zcbor::options_t &options_ = zcbor::options_t ()) :
        options (options_),
        source (data_, size_),
        cursor (source, 4),
        reader (cursor, stack, options)
    {
    }

    zcbor::token_t next ()
    {
        zcbor::token_t token;
        TEST_ASSERT_EQUAL_INT (1, reader.next_token (token));
        return token;
    }

    int fail ()
    {
        zcbor::token_t token;
        TEST_ASSERT_EQUAL_INT (-1, reader.next_token (token));
        return errno;
    }

    zcbor::options_t options;
    zcbor::buffer_source_t source;
    zcbor::byte_cursor_t cursor;
    zcbor::construct_stack_t stack;
    zcbor::token_reader_t reader;
};

static const zcbor::integer_t &integer_of (const zcbor::token_t &token_)
{
    TEST_ASSERT_EQUAL_INT (zcbor::kind_int, token_.kind);
    TEST_ASSERT_TRUE (token_.value);
    const zcbor::integer_t *integer =
      boost::get<zcbor::integer_t> (&*token_.value);
    TEST_ASSERT_NOT_NULL (integer);
    return *integer;
}

static double float_of (const zcbor::token_t &token_)
{
    TEST_ASSERT_EQUAL_INT (zcbor::kind_float, token_.kind);
    TEST_ASSERT_TRUE (token_.value);
    return boost::get<double> (*token_.value);
}

void test_immediate_integers ()
{
    for (unsigned int b = 0x00; b <= 0x17; ++b) {
        const unsigned char byte = static_cast<unsigned char> (b);
        reader_fixture_t f (&byte, 1);
        const zcbor::integer_t value = integer_of (f.next ());
        TEST_ASSERT_TRUE (zcbor::to_int128 (value) == static_cast<int> (b));
    }

    for (unsigned int b = 0x20; b <= 0x37; ++b) {
        const unsigned char byte = static_cast<unsigned char> (b);
        reader_fixture_t f (&byte, 1);
        const zcbor::integer_t value = integer_of (f.next ());
        TEST_ASSERT_NOT_NULL (boost::get<int8_t> (&value));
        TEST_ASSERT_TRUE (zcbor::to_int128 (value)
                          == -static_cast<int> (b - 0x20) - 1);
    }
}

void test_unsigned_keeps_width ()
{
    const unsigned char data[] = {
      0x00, 0x17, 0x18, 0xff, 0x19, 0x01, 0x00, 0x1a, 0x00, 0x01, 0x00,
      0x00, 0x1b, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
    reader_fixture_t f (data, sizeof (data));

    const zcbor::integer_t i0 = integer_of (f.next ());
    TEST_ASSERT_NOT_NULL (boost::get<uint8_t> (&i0));
    TEST_ASSERT_EQUAL_UINT8 (0, boost::get<uint8_t> (i0));

    const zcbor::integer_t i23 = integer_of (f.next ());
    TEST_ASSERT_EQUAL_UINT8 (23, boost::get<uint8_t> (i23));

    const zcbor::integer_t i255 = integer_of (f.next ());
    TEST_ASSERT_EQUAL_UINT8 (255, boost::get<uint8_t> (i255));

    const zcbor::integer_t i256 = integer_of (f.next ());
    TEST_ASSERT_NOT_NULL (boost::get<uint16_t> (&i256));
    TEST_ASSERT_EQUAL_UINT16 (256, boost::get<uint16_t> (i256));

    const zcbor::integer_t i65536 = integer_of (f.next ());
    TEST_ASSERT_NOT_NULL (boost::get<uint32_t> (&i65536));
    TEST_ASSERT_EQUAL_UINT32 (65536, boost::get<uint32_t> (i65536));

    const zcbor::integer_t i2p32 = integer_of (f.next ());
    TEST_ASSERT_NOT_NULL (boost::get<uint64_t> (&i2p32));
    TEST_ASSERT_EQUAL_STRING ("4294967296",
                              zcbor::to_diagnostic (i2p32).c_str ());

    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (0, f.reader.next_token (token));
}

void test_negative_ladder ()
{
    zcbor::integer_t value = zcbor::negative_integer (uint8_t (0));
    TEST_ASSERT_NOT_NULL (boost::get<int8_t> (&value));
    TEST_ASSERT_EQUAL_INT8 (-1, boost::get<int8_t> (value));

    value = zcbor::negative_integer (uint8_t (127));
    TEST_ASSERT_NOT_NULL (boost::get<int8_t> (&value));
    TEST_ASSERT_EQUAL_INT8 (-128, boost::get<int8_t> (value));

    value = zcbor::negative_integer (uint8_t (128));
    TEST_ASSERT_NOT_NULL (boost::get<int16_t> (&value));
    TEST_ASSERT_EQUAL_INT16 (-129, boost::get<int16_t> (value));

    value = zcbor::negative_integer (uint8_t (255));
    TEST_ASSERT_NOT_NULL (boost::get<int16_t> (&value));
    TEST_ASSERT_EQUAL_INT16 (-256, boost::get<int16_t> (value));

    value = zcbor::negative_integer (uint16_t (32767));
    TEST_ASSERT_NOT_NULL (boost::get<int16_t> (&value));
    TEST_ASSERT_EQUAL_INT16 (-32768, boost::get<int16_t> (value));

    value = zcbor::negative_integer (uint16_t (32768));
    TEST_ASSERT_NOT_NULL (boost::get<int32_t> (&value));
    TEST_ASSERT_EQUAL_INT32 (-32769, boost::get<int32_t> (value));

    value = zcbor::negative_integer (uint32_t (0x80000000u));
    TEST_ASSERT_NOT_NULL (boost::get<int64_t> (&value));
    TEST_ASSERT_EQUAL_STRING ("-2147483649",
                              zcbor::to_diagnostic (value).c_str ());

    value = zcbor::negative_integer (uint64_t (0x7fffffffffffffffull));
    TEST_ASSERT_NOT_NULL (boost::get<int64_t> (&value));
    TEST_ASSERT_EQUAL_STRING ("-9223372036854775808",
                              zcbor::to_diagnostic (value).c_str ());

    value = zcbor::negative_integer (uint64_t (0x8000000000000000ull));
    TEST_ASSERT_NOT_NULL (boost::get<zcbor::int128_t> (&value));
    TEST_ASSERT_EQUAL_STRING ("-9223372036854775809",
                              zcbor::to_diagnostic (value).c_str ());
}

void test_negative_from_wire ()
{
    const unsigned char data[] = {0x20, 0x37, 0x38, 0x7f, 0x38, 0xff, 0x3b,
                                  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
                                  0xff};
    reader_fixture_t f (data, sizeof (data));

    const zcbor::integer_t minus1 = integer_of (f.next ());
    TEST_ASSERT_EQUAL_INT8 (-1, boost::get<int8_t> (minus1));

    const zcbor::integer_t minus24 = integer_of (f.next ());
    TEST_ASSERT_EQUAL_INT8 (-24, boost::get<int8_t> (minus24));

    const zcbor::integer_t minus128 = integer_of (f.next ());
    TEST_ASSERT_EQUAL_INT8 (-128, boost::get<int8_t> (minus128));

    const zcbor::integer_t minus256 = integer_of (f.next ());
    TEST_ASSERT_EQUAL_INT16 (-256, boost::get<int16_t> (minus256));

    //  Magnitude 2^64 - 1 only fits the 128-bit rung.
    const zcbor::integer_t lowest = integer_of (f.next ());
    TEST_ASSERT_NOT_NULL (boost::get<zcbor::int128_t> (&lowest));
    TEST_ASSERT_EQUAL_STRING ("-18446744073709551616",
                              zcbor::to_diagnostic (lowest).c_str ());
}

void test_byte_and_text_strings ()
{
    const unsigned char data[] = {0x43, 0x01, 0x02, 0x03, 0x63, 'a',  'b',
                                  'c',  0x40, 0x7b, 0x00, 0x00, 0x00, 0x00,
                                  0x00, 0x00, 0x00, 0x02, 'h',  'i'};
    reader_fixture_t f (data, sizeof (data));

    zcbor::token_t token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes, token.kind);
    const zcbor::bytes_t &bytes = boost::get<zcbor::bytes_t> (*token.value);
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (bytes.size ()));
    TEST_ASSERT_EQUAL_HEX8 (0x03, bytes[2]);
    TEST_ASSERT_FALSE (token.chunks);

    token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_string, token.kind);
    TEST_ASSERT_EQUAL_STRING ("abc",
                              boost::get<std::string> (*token.value).c_str ());

    token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes, token.kind);
    TEST_ASSERT_TRUE (boost::get<zcbor::bytes_t> (*token.value).empty ());

    //  Length with an eight byte argument.
    token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_string, token.kind);
    TEST_ASSERT_EQUAL_STRING ("hi",
                              boost::get<std::string> (*token.value).c_str ());
}

void test_simple_values ()
{
    const unsigned char data[] = {0xf4, 0xf5, 0xf6, 0xf7};
    reader_fixture_t f (data, sizeof (data));

    zcbor::token_t token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bool, token.kind);
    TEST_ASSERT_FALSE (boost::get<bool> (*token.value));

    token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bool, token.kind);
    TEST_ASSERT_TRUE (boost::get<bool> (*token.value));

    token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_null, token.kind);
    TEST_ASSERT_FALSE (token.value);

    token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_undefined, token.kind);
    TEST_ASSERT_FALSE (token.value);
}

void test_floats ()
{
    const unsigned char data[] = {
      0xf9, 0x3c, 0x00,                                     // 1.0
      0xf9, 0x00, 0x01,                                     // 2^-24
      0xf9, 0xfc, 0x00,                                     // -Infinity
      0xf9, 0x7e, 0x00,                                     // NaN
      0xfa, 0x3f, 0xc0, 0x00, 0x00,                         // 1.5
      0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a, // 1.1
    };
    reader_fixture_t f (data, sizeof (data));

    TEST_ASSERT_TRUE (float_of (f.next ()) == 1.0);
    TEST_ASSERT_TRUE (float_of (f.next ()) == std::ldexp (1.0, -24));

    const double neg_inf = float_of (f.next ());
    TEST_ASSERT_TRUE (std::isinf (neg_inf) && neg_inf < 0);

    TEST_ASSERT_TRUE (std::isnan (float_of (f.next ())));
    TEST_ASSERT_TRUE (float_of (f.next ()) == 1.5);
    TEST_ASSERT_TRUE (float_of (f.next ()) == 1.1);
}

void test_definite_array_header ()
{
    const unsigned char data[] = {0x83, 0x98, 0x20};
    reader_fixture_t f (data, sizeof (data));

    zcbor::token_t token = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_array, token.kind);
    TEST_ASSERT_TRUE (token.size);
    TEST_ASSERT_EQUAL_UINT32 (3, *token.size);
    TEST_ASSERT_FALSE (token.value);
    TEST_ASSERT_TRUE (f.stack.empty ());

    token = f.next ();
    TEST_ASSERT_EQUAL_UINT32 (32, *token.size);
    TEST_ASSERT_TRUE (f.stack.empty ());
}

void test_breaks_close_innermost_construct ()
{
    const unsigned char data[] = {0x9f, 0x5f, 0x7f, 0xff, 0xff, 0xff};
    reader_fixture_t f (data, sizeof (data));

    TEST_ASSERT_EQUAL_INT (zcbor::kind_array, f.next ().kind);
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes_array, f.next ().kind);

    const zcbor::token_t opener = f.next ();
    TEST_ASSERT_EQUAL_INT (zcbor::kind_string_array, opener.kind);
    TEST_ASSERT_FALSE (opener.size);
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (f.stack.depth ()));

    TEST_ASSERT_EQUAL_INT (zcbor::kind_string_array_end, f.next ().kind);
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes_array_end, f.next ().kind);
    TEST_ASSERT_EQUAL_INT (zcbor::kind_array_end, f.next ().kind);
    TEST_ASSERT_TRUE (f.stack.empty ());
}

void test_break_without_opener ()
{
    const unsigned char data[] = {0xff};
    reader_fixture_t f (data, sizeof (data));
    TEST_ASSERT_EQUAL_INT (ZCBOR_EBREAK, f.fail ());
}

void test_unsupported_leading_bytes ()
{
    //  Maps, tags, reserved additional information, other simple values.
    const unsigned char bytes[] = {0xa0, 0xa1, 0xbf, 0xc0, 0xd8, 0xdf,
                                   0x1c, 0x1f, 0x3d, 0x5e, 0x7c, 0x9d,
                                   0xe0, 0xf3, 0xf8, 0xfc, 0xfe};
    for (size_t i = 0; i < sizeof (bytes); ++i) {
        reader_fixture_t f (&bytes[i], 1);
        TEST_ASSERT_EQUAL_INT (ZCBOR_EBADBYTE, f.fail ());
    }
}

void test_size_limit ()
{
    zcbor::options_t options;
    options.max_size = 4;

    const unsigned char long_bytes[] = {0x45, 0x01, 0x02, 0x03, 0x04, 0x05};
    reader_fixture_t f1 (long_bytes, sizeof (long_bytes), options);
    TEST_ASSERT_EQUAL_INT (ZCBOR_ESIZE, f1.fail ());

    const unsigned char long_array[] = {0x85};
    reader_fixture_t f2 (long_array, sizeof (long_array), options);
    TEST_ASSERT_EQUAL_INT (ZCBOR_ESIZE, f2.fail ());

    const unsigned char at_limit[] = {0x64, 'a', 'b', 'c', 'd'};
    reader_fixture_t f3 (at_limit, sizeof (at_limit), options);
    TEST_ASSERT_EQUAL_INT (zcbor::kind_string, f3.next ().kind);

    //  2^32 does not fit the default limit either.
    const unsigned char huge[] = {0x7b, 0x00, 0x00, 0x00, 0x01,
                                  0x00, 0x00, 0x00, 0x00};
    reader_fixture_t f4 (huge, sizeof (huge));
    TEST_ASSERT_EQUAL_INT (ZCBOR_ESIZE, f4.fail ());
}

void test_truncated_header ()
{
    const unsigned char short_argument[] = {0x19, 0x01};
    reader_fixture_t f1 (short_argument, sizeof (short_argument));
    TEST_ASSERT_EQUAL_INT (ZCBOR_ETRUNCATED, f1.fail ());

    const unsigned char short_payload[] = {0x45, 0x01, 0x02, 0x03};
    reader_fixture_t f2 (short_payload, sizeof (short_payload));
    TEST_ASSERT_EQUAL_INT (ZCBOR_ETRUNCATED, f2.fail ());

    const unsigned char short_float[] = {0xfb, 0x00, 0x00};
    reader_fixture_t f3 (short_float, sizeof (short_float));
    TEST_ASSERT_EQUAL_INT (ZCBOR_ETRUNCATED, f3.fail ());
}

void test_token_offset ()
{
    const unsigned char data[] = {0x19, 0x01, 0x00, 0x61, 'x', 0x01};
    reader_fixture_t f (data, sizeof (data));

    f.next ();
    TEST_ASSERT_TRUE (f.reader.token_offset () == 0);
    f.next ();
    TEST_ASSERT_TRUE (f.reader.token_offset () == 3);
    f.next ();
    TEST_ASSERT_TRUE (f.reader.token_offset () == 5);
    TEST_ASSERT_TRUE (f.cursor.offset () == sizeof (data));
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_immediate_integers);
    RUN_TEST (test_unsigned_keeps_width);
    RUN_TEST (test_negative_ladder);
    RUN_TEST (test_negative_from_wire);
    RUN_TEST (test_byte_and_text_strings);
    RUN_TEST (test_simple_values);
    RUN_TEST (test_floats);
    RUN_TEST (test_definite_array_header);
    RUN_TEST (test_breaks_close_innermost_construct);
    RUN_TEST (test_break_without_opener);
    RUN_TEST (test_unsupported_leading_bytes);
    RUN_TEST (test_size_limit);
    RUN_TEST (test_truncated_header);
    RUN_TEST (test_token_offset);

    return UNITY_END ();
}
