/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "io/buffer_source.hpp"
#include "protocol/byte_cursor.hpp"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

//  Source that fails on every read.
class failing_source_t : public zcbor::i_source
{
  public:
    int read (unsigned char *, size_t) ZCBOR_OVERRIDE
    {
        errno = EIO;
        return -1;
    }
    const char *name () const ZCBOR_OVERRIDE { return "failing_source"; }
};

void test_read_big_endian_widths ()
{
    const unsigned char data[] = {0x2a, 0x01, 0x02, 0x00, 0x01, 0x00,
                                  0x00, 0x00, 0x00, 0x00, 0x01, 0x00,
                                  0x00, 0x00, 0x00, 0x00, 0x02};
    zcbor::buffer_source_t source (data, sizeof (data));

    //  A three byte block forces refills in the middle of every width.
    zcbor::byte_cursor_t cursor (source, 3);

    uint8_t u8 = 0;
    TEST_ASSERT_EQUAL_INT (0, cursor.read_uint8 (u8));
    TEST_ASSERT_EQUAL_UINT8 (0x2a, u8);

    uint16_t u16 = 0;
    TEST_ASSERT_EQUAL_INT (0, cursor.read_uint16 (u16));
    TEST_ASSERT_EQUAL_UINT16 (0x0102, u16);

    uint32_t u32 = 0;
    TEST_ASSERT_EQUAL_INT (0, cursor.read_uint32 (u32));
    TEST_ASSERT_EQUAL_UINT32 (0x00010000u, u32);

    uint64_t u64 = 0;
    TEST_ASSERT_EQUAL_INT (0, cursor.read_uint64 (u64));
    TEST_ASSERT_TRUE (u64 == 0x0000000100000002ull);

    TEST_ASSERT_TRUE (cursor.offset () == sizeof (data));
}

void test_next_byte_and_offset ()
{
    const unsigned char data[] = {0x10, 0x20};
    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::byte_cursor_t cursor (source, 1);

    unsigned char byte = 0;
    TEST_ASSERT_EQUAL_INT (1, cursor.next_byte (byte));
    TEST_ASSERT_EQUAL_HEX8 (0x10, byte);
    TEST_ASSERT_TRUE (cursor.offset () == 1);

    TEST_ASSERT_EQUAL_INT (1, cursor.next_byte (byte));
    TEST_ASSERT_EQUAL_HEX8 (0x20, byte);
    TEST_ASSERT_TRUE (cursor.offset () == 2);
    TEST_ASSERT_FALSE (cursor.eof ());
}

void test_end_of_input_is_sticky ()
{
    zcbor::buffer_source_t source (NULL, 0);
    zcbor::byte_cursor_t cursor (source, 16);

    unsigned char byte = 0;
    TEST_ASSERT_EQUAL_INT (0, cursor.next_byte (byte));
    TEST_ASSERT_TRUE (cursor.eof ());
    TEST_ASSERT_EQUAL_INT (0, cursor.next_byte (byte));
    TEST_ASSERT_TRUE (cursor.offset () == 0);
}

void test_read_bytes_across_blocks ()
{
    const unsigned char data[] = {'h', 'e', 'l', 'l', 'o', '!'};
    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::byte_cursor_t cursor (source, 2);

    std::vector<unsigned char> bytes;
    TEST_ASSERT_EQUAL_INT (0, cursor.read_bytes (5, bytes));
    TEST_ASSERT_EQUAL_INT (5, static_cast<int> (bytes.size ()));
    TEST_ASSERT_EQUAL_MEMORY ("hello", &bytes[0], 5);
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (source.remaining ()));

    std::string text;
    TEST_ASSERT_EQUAL_INT (0, cursor.read_string (1, text));
    TEST_ASSERT_EQUAL_STRING ("!", text.c_str ());

    //  Zero-length reads succeed at end of input.
    TEST_ASSERT_EQUAL_INT (0, cursor.read_string (0, text));
    TEST_ASSERT_TRUE (cursor.offset () == sizeof (data));
}

void test_truncated_width ()
{
    const unsigned char data[] = {0x01, 0x02, 0x03};
    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::byte_cursor_t cursor (source, 8);

    uint32_t value = 0;
    TEST_ASSERT_EQUAL_INT (-1, cursor.read_uint32 (value));
    TEST_ASSERT_EQUAL_INT (ZCBOR_ETRUNCATED, errno);
}

void test_truncated_bytes ()
{
    const unsigned char data[] = {0x01, 0x02};
    zcbor::buffer_source_t source (data, sizeof (data));
    zcbor::byte_cursor_t cursor (source, 8);

    std::vector<unsigned char> bytes;
    TEST_ASSERT_EQUAL_INT (-1, cursor.read_bytes (3, bytes));
    TEST_ASSERT_EQUAL_INT (ZCBOR_ETRUNCATED, errno);
}

void test_source_failure ()
{
    failing_source_t source;
    zcbor::byte_cursor_t cursor (source, 8);

    unsigned char byte = 0;
    TEST_ASSERT_EQUAL_INT (-1, cursor.next_byte (byte));
    TEST_ASSERT_EQUAL_INT (EIO, errno);

    uint16_t value = 0;
    TEST_ASSERT_EQUAL_INT (-1, cursor.read_uint16 (value));
    TEST_ASSERT_EQUAL_INT (EIO, errno);
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_read_big_endian_widths);
    RUN_TEST (test_next_byte_and_offset);
    RUN_TEST (test_end_of_input_is_sticky);
    RUN_TEST (test_read_bytes_across_blocks);
    RUN_TEST (test_truncated_width);
    RUN_TEST (test_truncated_bytes);
    RUN_TEST (test_source_failure);

    return UNITY_END ();
}
