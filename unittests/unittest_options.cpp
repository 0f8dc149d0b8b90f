/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"

#include <unity.h>
#include <stdlib.h>

void setUp ()
{
}

void tearDown ()
{
    unsetenv ("ZCBOR_MAX_SIZE");
    unsetenv ("ZCBOR_MAX_DEPTH");
    unsetenv ("ZCBOR_READ_BUFFER_SIZE");
}

static int get_int (const zcbor::options_t &options_, int option_)
{
    int value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_EQUAL_INT (0, options_.getopt (option_, &value, &size));
    TEST_ASSERT_EQUAL_INT (static_cast<int> (sizeof (int)),
                           static_cast<int> (size));
    return value;
}

void test_defaults ()
{
    const zcbor::options_t options;
    TEST_ASSERT_EQUAL_INT (ZCBOR_MAX_SIZE_DFLT,
                           get_int (options, ZCBOR_MAX_SIZE));
    TEST_ASSERT_EQUAL_INT (ZCBOR_MAX_DEPTH_DFLT,
                           get_int (options, ZCBOR_MAX_DEPTH));
    TEST_ASSERT_EQUAL_INT (ZCBOR_READ_BUFFER_SIZE_DFLT,
                           get_int (options, ZCBOR_READ_BUFFER_SIZE));
}

void test_setopt ()
{
    zcbor::options_t options;

    int value = 1024;
    TEST_ASSERT_EQUAL_INT (
      0, options.setopt (ZCBOR_MAX_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_UINT32 (1024, options.max_size);

    value = 16;
    TEST_ASSERT_EQUAL_INT (
      0, options.setopt (ZCBOR_MAX_DEPTH, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (16, options.max_depth);

    value = 64;
    TEST_ASSERT_EQUAL_INT (
      0, options.setopt (ZCBOR_READ_BUFFER_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (64, get_int (options, ZCBOR_READ_BUFFER_SIZE));
}

void test_setopt_invalid ()
{
    zcbor::options_t options;

    int value = 0;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (ZCBOR_MAX_DEPTH, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    value = -5;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (ZCBOR_MAX_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    value = 8;
    TEST_ASSERT_EQUAL_INT (-1, options.setopt (99, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    const char wrong_size = 1;
    TEST_ASSERT_EQUAL_INT (-1, options.setopt (ZCBOR_MAX_DEPTH, &wrong_size,
                                               sizeof (wrong_size)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (ZCBOR_MAX_DEPTH_DFLT, options.max_depth);
    TEST_ASSERT_EQUAL_INT (ZCBOR_MAX_SIZE_DFLT,
                           get_int (options, ZCBOR_MAX_SIZE));
}

void test_getopt_invalid ()
{
    const zcbor::options_t options;

    char small[2];
    size_t size = sizeof (small);
    TEST_ASSERT_EQUAL_INT (-1, options.getopt (ZCBOR_MAX_DEPTH, small, &size));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    int value = 0;
    size = sizeof (value);
    TEST_ASSERT_EQUAL_INT (-1, options.getopt (42, &value, &size));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_from_env ()
{
    setenv ("ZCBOR_MAX_SIZE", "4096", 1);
    setenv ("ZCBOR_MAX_DEPTH", "7", 1);
    setenv ("ZCBOR_READ_BUFFER_SIZE", "128", 1);

    const zcbor::options_t options = zcbor::options_t::from_env ();
    TEST_ASSERT_EQUAL_UINT32 (4096, options.max_size);
    TEST_ASSERT_EQUAL_INT (7, options.max_depth);
    TEST_ASSERT_EQUAL_INT (128, static_cast<int> (options.read_buffer_size));
}

void test_from_env_ignores_invalid ()
{
    setenv ("ZCBOR_MAX_DEPTH", "deep", 1);
    setenv ("ZCBOR_READ_BUFFER_SIZE", "0", 1);

    const zcbor::options_t options = zcbor::options_t::from_env ();
    TEST_ASSERT_EQUAL_INT (ZCBOR_MAX_DEPTH_DFLT, options.max_depth);
    TEST_ASSERT_EQUAL_INT (ZCBOR_READ_BUFFER_SIZE_DFLT,
                           static_cast<int> (options.read_buffer_size));
}

void test_from_env_clamps_max_size ()
{
    setenv ("ZCBOR_MAX_SIZE", "4294967296", 1);

    const zcbor::options_t options = zcbor::options_t::from_env ();
    TEST_ASSERT_EQUAL_UINT32 (ZCBOR_MAX_SIZE_DFLT, options.max_size);
}

void test_setopt_read_buffer_size_bounds ()
{
    zcbor::options_t options;

    int value = ZCBOR_READ_BUFFER_SIZE_MAX + 1;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (ZCBOR_READ_BUFFER_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (ZCBOR_READ_BUFFER_SIZE_DFLT,
                           get_int (options, ZCBOR_READ_BUFFER_SIZE));

    value = ZCBOR_READ_BUFFER_SIZE_MAX;
    TEST_ASSERT_EQUAL_INT (
      0, options.setopt (ZCBOR_READ_BUFFER_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (ZCBOR_READ_BUFFER_SIZE_MAX,
                           get_int (options, ZCBOR_READ_BUFFER_SIZE));
}

void test_from_env_rejects_huge_read_buffer ()
{
    setenv ("ZCBOR_READ_BUFFER_SIZE", "1000000000000000", 1);

    const zcbor::options_t options = zcbor::options_t::from_env ();
    TEST_ASSERT_EQUAL_INT (ZCBOR_READ_BUFFER_SIZE_DFLT,
                           static_cast<int> (options.read_buffer_size));

    //  The resulting options still decode.
    const unsigned char data[] = {0x82, 0x01, 0x61, 'x'};
    const decode_result_t result = decode_all (data, sizeof (data), options);
    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (result.items.size ()));
    TEST_ASSERT_EQUAL_STRING ("[1, \"x\"]", result.items[0].c_str ());
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_defaults);
    RUN_TEST (test_setopt);
    RUN_TEST (test_setopt_invalid);
    RUN_TEST (test_getopt_invalid);
    RUN_TEST (test_from_env);
    RUN_TEST (test_from_env_ignores_invalid);
    RUN_TEST (test_from_env_clamps_max_size);
    RUN_TEST (test_setopt_read_buffer_size_bounds);
    RUN_TEST (test_from_env_rejects_huge_read_buffer);

    return UNITY_END ();
}
