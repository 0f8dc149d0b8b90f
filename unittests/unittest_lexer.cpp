/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"
#include "io/buffer_source.hpp"
#include "protocol/lexer.hpp"

#include <unity.h>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

void test_scalars_in_sequence ()
{
    const unsigned char data[] = {0x01, 0x20, 0x61, 'a', 0x41, 0xff,
                                  0xf5, 0xf9, 0x3e, 0x00};
    const decode_result_t result = decode_all (data, sizeof (data));

    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_EQUAL_INT (6, static_cast<int> (result.items.size ()));
    TEST_ASSERT_EQUAL_STRING ("1", result.items[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("-1", result.items[1].c_str ());
    TEST_ASSERT_EQUAL_STRING ("\"a\"", result.items[2].c_str ());
    TEST_ASSERT_EQUAL_STRING ("h'ff'", result.items[3].c_str ());
    TEST_ASSERT_EQUAL_STRING ("true", result.items[4].c_str ());
    TEST_ASSERT_EQUAL_STRING ("1.5", result.items[5].c_str ());
}

void test_empty_input ()
{
    const decode_result_t result = decode_all (NULL, 0);
    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_TRUE (result.items.empty ());
}

void test_indefinite_array ()
{
    const unsigned char data[] = {0x9f, 0x01, 0x02, 0xff};
    TEST_ASSERT_EQUAL_STRING ("[_ 1, 2]",
                              decode_one (data, sizeof (data)).c_str ());

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::value_t value;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_value (value));
    const zcbor::array_t &array = boost::get<zcbor::array_t> (value);
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (array.size ()));
    TEST_ASSERT_EQUAL_STRING ("[1, 2]", zcbor::to_diagnostic (value).c_str ());
    TEST_ASSERT_EQUAL_INT (0, lexer.read_value (value));
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (lexer.depth ()));
}

void test_definite_arrays ()
{
    const unsigned char empty[] = {0x80};
    TEST_ASSERT_EQUAL_STRING ("[]",
                              decode_one (empty, sizeof (empty)).c_str ());

    const unsigned char nested[] = {0x83, 0x01, 0x82, 0x02,
                                    0x03, 0x82, 0x04, 0x05};
    TEST_ASSERT_EQUAL_STRING ("[1, [2, 3], [4, 5]]",
                              decode_one (nested, sizeof (nested)).c_str ());

    const unsigned char mixed[] = {0x82, 0x9f, 0x01, 0xff, 0x9f, 0x82,
                                   0x02, 0x03, 0xff};
    TEST_ASSERT_EQUAL_STRING ("[[1], [[2, 3]]]",
                              decode_one (mixed, sizeof (mixed)).c_str ());
}

void test_chunked_bytes ()
{
    const unsigned char data[] = {0x5f, 0x42, 0x01, 0x02, 0x41, 0x03, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));

    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes, token.kind);
    const zcbor::bytes_t &bytes = boost::get<zcbor::bytes_t> (*token.value);
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (bytes.size ()));
    TEST_ASSERT_EQUAL_HEX8 (0x01, bytes[0]);
    TEST_ASSERT_EQUAL_HEX8 (0x02, bytes[1]);
    TEST_ASSERT_EQUAL_HEX8 (0x03, bytes[2]);

    TEST_ASSERT_TRUE (token.chunks);
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (token.chunks->size ()));
    TEST_ASSERT_EQUAL_UINT32 (2, (*token.chunks)[0]);
    TEST_ASSERT_EQUAL_UINT32 (1, (*token.chunks)[1]);

    TEST_ASSERT_EQUAL_STRING ("(_ h'0102', h'03')",
                              zcbor::to_diagnostic (token).c_str ());
    TEST_ASSERT_EQUAL_STRING ("h'010203'",
                              zcbor::to_diagnostic (*token.value).c_str ());
}

void test_chunked_text ()
{
    const unsigned char data[] = {0x7f, 0x61, 'a', 0x60, 0x61, 'b', 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));

    TEST_ASSERT_EQUAL_INT (zcbor::kind_string, token.kind);
    TEST_ASSERT_EQUAL_STRING ("ab",
                              boost::get<std::string> (*token.value).c_str ());
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (token.chunks->size ()));
    TEST_ASSERT_EQUAL_STRING ("(_ \"a\", \"\", \"b\")",
                              zcbor::to_diagnostic (token).c_str ());
}

void test_chunked_text_counts_characters ()
{
    //  "\xc3\xa9" is one character, "\xe2\x82\xac" is one character.
    const unsigned char data[] = {0x7f, 0x62, 0xc3, 0xa9, 0x61, 'a',
                                  0x63, 0xe2, 0x82, 0xac, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));

    TEST_ASSERT_EQUAL_INT (zcbor::kind_string, token.kind);
    TEST_ASSERT_EQUAL_STRING ("\xc3\xa9"
                              "a\xe2\x82\xac",
                              boost::get<std::string> (*token.value).c_str ());
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (token.chunks->size ()));
    TEST_ASSERT_EQUAL_UINT32 (1, (*token.chunks)[0]);
    TEST_ASSERT_EQUAL_UINT32 (1, (*token.chunks)[1]);
    TEST_ASSERT_EQUAL_UINT32 (1, (*token.chunks)[2]);
    TEST_ASSERT_EQUAL_STRING ("(_ \"\xc3\xa9\", \"a\", \"\xe2\x82\xac\")",
                              zcbor::to_diagnostic (token).c_str ());
}

void test_chunked_bytes_counts_bytes ()
{
    const unsigned char data[] = {0x5f, 0x42, 0xc3, 0xa9, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));

    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes, token.kind);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (token.chunks->size ()));
    TEST_ASSERT_EQUAL_UINT32 (2, (*token.chunks)[0]);
    TEST_ASSERT_EQUAL_STRING ("(_ h'c3a9')",
                              zcbor::to_diagnostic (token).c_str ());
}

void test_empty_chunked_string ()
{
    const unsigned char data[] = {0x5f, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes, token.kind);
    TEST_ASSERT_TRUE (boost::get<zcbor::bytes_t> (*token.value).empty ());
    TEST_ASSERT_TRUE (token.chunks->empty ());
}

void test_chunked_string_inside_array ()
{
    const unsigned char data[] = {0x9f, 0x7f, 0x61, 'x', 0xff, 0x01, 0xff};
    TEST_ASSERT_EQUAL_STRING ("[_ \"x\", 1]",
                              decode_one (data, sizeof (data)).c_str ());
}

void test_null_and_undefined ()
{
    const unsigned char data[] = {0xf6, 0xf7};

    const decode_result_t result = decode_all (data, sizeof (data));
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (result.items.size ()));
    TEST_ASSERT_EQUAL_STRING ("null", result.items[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("undefined", result.items[1].c_str ());

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::value_t value;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_value (value));
    TEST_ASSERT_TRUE (zcbor::is_null (value));
    TEST_ASSERT_EQUAL_INT (1, lexer.read_value (value));
    TEST_ASSERT_TRUE (zcbor::is_null (value));
}

void test_truncated_string ()
{
    const unsigned char data[] = {0x45, 0x01, 0x02, 0x03};
    assert_decode_fails (data, sizeof (data), ZCBOR_ETRUNCATED);
}

void test_truncated_definite_array ()
{
    const unsigned char data[] = {0x82, 0x01};
    assert_decode_fails (data, sizeof (data), ZCBOR_ETRUNCATED);

    //  A large declared count is not trusted for allocation.
    const unsigned char huge[] = {0x9a, 0x00, 0x10, 0x00, 0x00, 0x01};
    assert_decode_fails (huge, sizeof (huge), ZCBOR_ETRUNCATED);
}

void test_missing_break ()
{
    const unsigned char array[] = {0x9f, 0x01, 0x02};
    assert_decode_fails (array, sizeof (array), ZCBOR_EEOF);

    const unsigned char chunks[] = {0x5f, 0x41, 0x01};
    assert_decode_fails (chunks, sizeof (chunks), ZCBOR_EEOF);

    const unsigned char inner[] = {0x81, 0x9f, 0x01};
    assert_decode_fails (inner, sizeof (inner), ZCBOR_EEOF);
}

void test_unexpected_break ()
{
    const unsigned char top[] = {0xff};
    assert_decode_fails (top, sizeof (top), ZCBOR_EBREAK);

    const unsigned char in_definite[] = {0x82, 0x01, 0xff};
    assert_decode_fails (in_definite, sizeof (in_definite), ZCBOR_EBREAK);

    //  The break closes the outer indefinite array while the definite
    //  array still expects an element.
    const unsigned char nested[] = {0x9f, 0x81, 0xff};
    assert_decode_fails (nested, sizeof (nested), ZCBOR_EBREAK);
}

void test_mixed_chunks ()
{
    const unsigned char text_in_bytes[] = {0x5f, 0x61, 'a', 0xff};
    assert_decode_fails (text_in_bytes, sizeof (text_in_bytes), ZCBOR_EMIXED);

    const unsigned char bytes_in_text[] = {0x7f, 0x41, 0x00, 0xff};
    assert_decode_fails (bytes_in_text, sizeof (bytes_in_text), ZCBOR_EMIXED);

    const unsigned char nested[] = {0x5f, 0x5f, 0xff, 0xff};
    assert_decode_fails (nested, sizeof (nested), ZCBOR_EMIXED);

    const unsigned char int_in_text[] = {0x7f, 0x01, 0xff};
    assert_decode_fails (int_in_text, sizeof (int_in_text), ZCBOR_EMIXED);
}

void test_unsupported_item ()
{
    const unsigned char map[] = {0x82, 0x01, 0xa0};
    assert_decode_fails (map, sizeof (map), ZCBOR_EBADBYTE);
}

void test_chunked_size_limit ()
{
    zcbor::options_t options;
    options.max_size = 3;

    const unsigned char data[] = {0x5f, 0x42, 0x01, 0x02,
                                  0x42, 0x03, 0x04, 0xff};
    assert_decode_fails (data, sizeof (data), ZCBOR_ESIZE, options);

    const unsigned char fits[] = {0x5f, 0x42, 0x01, 0x02, 0x41, 0x03, 0xff};
    const decode_result_t result = decode_all (fits, sizeof (fits), options);
    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (result.items.size ()));
}

void test_depth_limit ()
{
    zcbor::options_t options;
    options.max_depth = 2;

    const unsigned char shallow[] = {0x81, 0x9f, 0x01, 0xff};
    const decode_result_t ok = decode_all (shallow, sizeof (shallow), options);
    TEST_ASSERT_EQUAL_INT (0, ok.rc);
    TEST_ASSERT_EQUAL_STRING ("[[1]]", ok.items[0].c_str ());

    const unsigned char deep[] = {0x81, 0x81, 0x81, 0x01};
    assert_decode_fails (deep, sizeof (deep), ZCBOR_EDEPTH, options);

    const unsigned char deep_chunks[] = {0x81, 0x81, 0x5f, 0xff};
    assert_decode_fails (deep_chunks, sizeof (deep_chunks), ZCBOR_EDEPTH,
                         options);
}

void test_error_is_final ()
{
    const unsigned char data[] = {0x01, 0xff, 0x02};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;

    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));
    TEST_ASSERT_EQUAL_INT (0, lexer.error ());

    TEST_ASSERT_EQUAL_INT (-1, lexer.read_next (token));
    TEST_ASSERT_EQUAL_INT (ZCBOR_EBREAK, errno);
    TEST_ASSERT_TRUE (lexer.token_offset () == 1);

    errno = 0;
    TEST_ASSERT_EQUAL_INT (-1, lexer.read_next (token));
    TEST_ASSERT_EQUAL_INT (ZCBOR_EBREAK, errno);
    TEST_ASSERT_EQUAL_INT (ZCBOR_EBREAK, lexer.error ());
}

void test_three_nesting_levels ()
{
    const unsigned char data[] = {0x9f, 0x7f, 0x61, 'a', 0x61, 'b', 0xff,
                                  0x82, 0x01, 0x81, 0x02, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_next (token));
    TEST_ASSERT_EQUAL_STRING ("[_ \"ab\", [1, [2]]]",
                              zcbor::to_diagnostic (token).c_str ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (lexer.depth ()));
    TEST_ASSERT_EQUAL_INT (0, lexer.read_next (token));
}

void test_widened_negative_value ()
{
    const unsigned char data[] = {0x3a, 0xff, 0xff, 0xff, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::value_t value;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_value (value));

    const zcbor::integer_t &integer = boost::get<zcbor::integer_t> (value);
    TEST_ASSERT_NOT_NULL (boost::get<int64_t> (&integer));
    TEST_ASSERT_EQUAL_STRING ("-4294967296",
                              zcbor::to_diagnostic (value).c_str ());
}

void test_large_negative_value ()
{
    const unsigned char data[] = {0x3b, 0xff, 0xff, 0xff, 0xff,
                                  0xff, 0xff, 0xff, 0xff};

    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::lexer_t lexer (source);
    zcbor::value_t value;
    TEST_ASSERT_EQUAL_INT (1, lexer.read_value (value));

    const zcbor::integer_t &integer = boost::get<zcbor::integer_t> (value);
    const zcbor::int128_t expected = -(zcbor::int128_t (1) << 64);
    TEST_ASSERT_TRUE (zcbor::to_int128 (integer) == expected);
}

void test_small_read_buffer ()
{
    zcbor::options_t options;
    options.read_buffer_size = 1;

    const unsigned char data[] = {0x82, 0x63, 'a', 'b', 'c', 0x5f, 0x42,
                                  0x01, 0x02, 0xff, 0x19, 0x12, 0x34};
    const decode_result_t result = decode_all (data, sizeof (data), options);
    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (result.items.size ()));
    TEST_ASSERT_EQUAL_STRING ("[\"abc\", h'0102']", result.items[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("4660", result.items[1].c_str ());
}

void test_oversized_read_buffer ()
{
    zcbor::options_t options;
    options.read_buffer_size = static_cast<size_t> (1) << 40;

    const unsigned char data[] = {0x83, 0x01, 0x02, 0x03};
    const decode_result_t result = decode_all (data, sizeof (data), options);
    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (result.items.size ()));
    TEST_ASSERT_EQUAL_STRING ("[1, 2, 3]", result.items[0].c_str ());
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_scalars_in_sequence);
    RUN_TEST (test_empty_input);
    RUN_TEST (test_indefinite_array);
    RUN_TEST (test_definite_arrays);
    RUN_TEST (test_chunked_bytes);
    RUN_TEST (test_chunked_text);
    RUN_TEST (test_chunked_text_counts_characters);
    RUN_TEST (test_chunked_bytes_counts_bytes);
    RUN_TEST (test_empty_chunked_string);
    RUN_TEST (test_chunked_string_inside_array);
    RUN_TEST (test_null_and_undefined);
    RUN_TEST (test_truncated_string);
    RUN_TEST (test_truncated_definite_array);
    RUN_TEST (test_missing_break);
    RUN_TEST (test_unexpected_break);
    RUN_TEST (test_mixed_chunks);
    RUN_TEST (test_unsupported_item);
    RUN_TEST (test_chunked_size_limit);
    RUN_TEST (test_depth_limit);
    RUN_TEST (test_error_is_final);
    RUN_TEST (test_three_nesting_levels);
    RUN_TEST (test_widened_negative_value);
    RUN_TEST (test_large_negative_value);
    RUN_TEST (test_small_read_buffer);
    RUN_TEST (test_oversized_read_buffer);

    return UNITY_END ();
}
