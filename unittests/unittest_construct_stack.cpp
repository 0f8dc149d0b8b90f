/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/construct_stack.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_pop_returns_innermost ()
{
    zcbor::construct_stack_t stack;
    TEST_ASSERT_TRUE (stack.empty ());

    stack.push (zcbor::kind_array);
    stack.push (zcbor::kind_bytes_array);
    stack.push (zcbor::kind_string_array);
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (stack.depth ()));

    zcbor::kind_t kind = zcbor::kind_null;
    TEST_ASSERT_EQUAL_INT (0, stack.pop (kind));
    TEST_ASSERT_EQUAL_INT (zcbor::kind_string_array, kind);
    TEST_ASSERT_EQUAL_INT (0, stack.pop (kind));
    TEST_ASSERT_EQUAL_INT (zcbor::kind_bytes_array, kind);
    TEST_ASSERT_EQUAL_INT (0, stack.pop (kind));
    TEST_ASSERT_EQUAL_INT (zcbor::kind_array, kind);
    TEST_ASSERT_TRUE (stack.empty ());
}

void test_pop_empty_fails ()
{
    zcbor::construct_stack_t stack;

    zcbor::kind_t kind = zcbor::kind_int;
    TEST_ASSERT_EQUAL_INT (-1, stack.pop (kind));
    TEST_ASSERT_EQUAL_INT (ZCBOR_EBREAK, errno);
    TEST_ASSERT_EQUAL_INT (zcbor::kind_int, kind);

    stack.push (zcbor::kind_array);
    TEST_ASSERT_EQUAL_INT (0, stack.pop (kind));
    TEST_ASSERT_EQUAL_INT (-1, stack.pop (kind));
    TEST_ASSERT_EQUAL_INT (ZCBOR_EBREAK, errno);
}

void test_same_kind_nests ()
{
    zcbor::construct_stack_t stack;
    for (int i = 0; i < 100; ++i)
        stack.push (zcbor::kind_array);
    TEST_ASSERT_EQUAL_INT (100, static_cast<int> (stack.depth ()));

    zcbor::kind_t kind;
    while (!stack.empty ()) {
        TEST_ASSERT_EQUAL_INT (0, stack.pop (kind));
        TEST_ASSERT_EQUAL_INT (zcbor::kind_array, kind);
    }
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_pop_returns_innermost);
    RUN_TEST (test_pop_empty_fails);
    RUN_TEST (test_same_kind_nests);

    return UNITY_END ();
}
