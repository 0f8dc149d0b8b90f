/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"
#include "io/fd_source.hpp"
#include "protocol/lexer.hpp"

#include <unity.h>
#include <unistd.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

//  Returns the read end of a pipe already holding data_ with its write
//  end closed.
static int make_filled_pipe (const unsigned char *data_, size_t size_)
{
    int fds[2];
    TEST_ASSERT_EQUAL_INT (0, pipe (fds));

    size_t written = 0;
    while (written < size_) {
        const ssize_t rc = write (fds[1], data_ + written, size_ - written);
        TEST_ASSERT_TRUE (rc > 0);
        written += static_cast<size_t> (rc);
    }
    TEST_ASSERT_EQUAL_INT (0, close (fds[1]));
    return fds[0];
}

static decode_result_t decode_pipe (const unsigned char *data_,
                                    size_t size_,
                                    const zcbor::options_t &options_)
{
    zcbor::fd_source_t source (make_filled_pipe (data_, size_), true);
    TEST_ASSERT_TRUE (source.is_open ());

    zcbor::lexer_t lexer (source, options_);

    decode_result_t result;
    zcbor::token_t token;
    while ((result.rc = lexer.read_next (token)) == 1)
        result.items.push_back (zcbor::to_diagnostic (token));
    result.err = result.rc == -1 ? errno : 0;
    return result;
}

void test_stream_matches_buffer ()
{
    const unsigned char data[] = {0x9f, 0x01, 0x5f, 0x41, 0xaa, 0x41, 0xbb,
                                  0xff, 0x82, 0x61, 'z',  0xf6, 0xff, 0x3a,
                                  0x00, 0x01, 0x00, 0x00, 0xf7};

    const size_t sizes[] = {1, 3, 8192};
    for (size_t i = 0; i < sizeof (sizes) / sizeof (sizes[0]); ++i) {
        zcbor::options_t options;
        options.read_buffer_size = sizes[i];

        const decode_result_t expected =
          decode_all (data, sizeof (data), options);
        const decode_result_t actual =
          decode_pipe (data, sizeof (data), options);

        TEST_ASSERT_EQUAL_INT (0, actual.rc);
        TEST_ASSERT_EQUAL_INT (static_cast<int> (expected.items.size ()),
                               static_cast<int> (actual.items.size ()));
        for (size_t j = 0; j < expected.items.size (); ++j)
            TEST_ASSERT_EQUAL_STRING (expected.items[j].c_str (),
                                      actual.items[j].c_str ());
    }
}

void test_stream_reports_decode_errors ()
{
    const unsigned char data[] = {0x01, 0x9f, 0x02};
    const decode_result_t result =
      decode_pipe (data, sizeof (data), zcbor::options_t ());

    TEST_ASSERT_EQUAL_INT (-1, result.rc);
    TEST_ASSERT_EQUAL_INT (ZCBOR_EEOF, result.err);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (result.items.size ()));
}

void test_end_of_stream_is_sticky ()
{
    const unsigned char data[] = {0x01};
    zcbor::fd_source_t source (make_filled_pipe (data, sizeof (data)), true);

    unsigned char buf[16];
    TEST_ASSERT_EQUAL_INT (1, source.read (buf, sizeof (buf)));
    TEST_ASSERT_EQUAL_HEX8 (0x01, buf[0]);
    TEST_ASSERT_EQUAL_INT (0, source.read (buf, sizeof (buf)));
    TEST_ASSERT_EQUAL_INT (0, source.read (buf, sizeof (buf)));
}

void test_borrowed_descriptor_stays_open ()
{
    const unsigned char data[] = {0x01};
    const int fd = make_filled_pipe (data, sizeof (data));
    {
        zcbor::fd_source_t source (fd);
        TEST_ASSERT_TRUE (source.is_open ());
    }

    //  Still readable after the source is gone.
    unsigned char byte = 0;
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (read (fd, &byte, 1)));
    TEST_ASSERT_EQUAL_HEX8 (0x01, byte);
    TEST_ASSERT_EQUAL_INT (0, close (fd));
}

void test_invalid_descriptor ()
{
    zcbor::fd_source_t source (-1);
    TEST_ASSERT_FALSE (source.is_open ());

    unsigned char buf[4];
    TEST_ASSERT_EQUAL_INT (-1, source.read (buf, sizeof (buf)));
    TEST_ASSERT_EQUAL_INT (EBADF, errno);

    zcbor::lexer_t lexer (source);
    zcbor::token_t token;
    TEST_ASSERT_EQUAL_INT (-1, lexer.read_next (token));
    TEST_ASSERT_EQUAL_INT (EBADF, errno);
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_stream_matches_buffer);
    RUN_TEST (test_stream_reports_decode_errors);
    RUN_TEST (test_end_of_stream_is_sticky);
    RUN_TEST (test_borrowed_descriptor_stays_open);
    RUN_TEST (test_invalid_descriptor);

    return UNITY_END ();
}
