/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/token.hpp"
#include "protocol/value.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <cmath>
#include <limits>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

static std::string diag (double value_)
{
    return zcbor::to_diagnostic (zcbor::value_t (value_));
}

void test_float_diagnostics ()
{
    TEST_ASSERT_EQUAL_STRING ("1.0", diag (1.0).c_str ());
    TEST_ASSERT_EQUAL_STRING ("-0.0", diag (-0.0).c_str ());
    TEST_ASSERT_EQUAL_STRING ("1.1", diag (1.1).c_str ());
    TEST_ASSERT_EQUAL_STRING ("100000.0", diag (100000.0).c_str ());
    TEST_ASSERT_EQUAL_STRING ("1000000000000000.0", diag (1e15).c_str ());
    TEST_ASSERT_EQUAL_STRING ("1.0e+16", diag (1e16).c_str ());
    TEST_ASSERT_EQUAL_STRING ("1.0e+20", diag (1e20).c_str ());
    TEST_ASSERT_EQUAL_STRING ("1.5e+20", diag (1.5e20).c_str ());
    TEST_ASSERT_EQUAL_STRING ("0.0001", diag (0.0001).c_str ());
    TEST_ASSERT_EQUAL_STRING ("5.0e-05", diag (0.00005).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "Infinity", diag (std::numeric_limits<double>::infinity ()).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "-Infinity", diag (-std::numeric_limits<double>::infinity ()).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "NaN", diag (std::numeric_limits<double>::quiet_NaN ()).c_str ());

    //  Single precision values print with the digits they carry.
    TEST_ASSERT_EQUAL_STRING (
      "3.4028234663852886e+38",
      diag (zcbor::float_from_bits (0x7f7fffffu)).c_str ());
}

void test_half_precision_bits ()
{
    TEST_ASSERT_EQUAL_HEX32 (0x00000000u, zcbor::half_to_float_bits (0x0000));
    TEST_ASSERT_EQUAL_HEX32 (0x80000000u, zcbor::half_to_float_bits (0x8000));
    TEST_ASSERT_EQUAL_HEX32 (0x3f800000u, zcbor::half_to_float_bits (0x3c00));
    TEST_ASSERT_EQUAL_HEX32 (0x477fe000u, zcbor::half_to_float_bits (0x7bff));
    TEST_ASSERT_EQUAL_HEX32 (0x33800000u, zcbor::half_to_float_bits (0x0001));
    TEST_ASSERT_EQUAL_HEX32 (0x387fc000u, zcbor::half_to_float_bits (0x03ff));
    TEST_ASSERT_EQUAL_HEX32 (0x7f800000u, zcbor::half_to_float_bits (0x7c00));
    TEST_ASSERT_EQUAL_HEX32 (0xff800000u, zcbor::half_to_float_bits (0xfc00));
    TEST_ASSERT_EQUAL_HEX32 (0x7fc00000u, zcbor::half_to_float_bits (0x7e00));
}

void test_scalar_diagnostics ()
{
    TEST_ASSERT_EQUAL_STRING (
      "null", zcbor::to_diagnostic (zcbor::value_t (zcbor::null_t ())).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "false", zcbor::to_diagnostic (zcbor::value_t (false)).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "18446744073709551615",
      zcbor::to_diagnostic (zcbor::integer_t (UINT64_MAX)).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "-128", zcbor::to_diagnostic (zcbor::integer_t (int8_t (-128))).c_str ());
}

void test_string_diagnostics ()
{
    const std::string text ("a\"b\\c\n\x01");
    TEST_ASSERT_EQUAL_STRING (
      "\"a\\\"b\\\\c\\n\\u0001\"",
      zcbor::to_diagnostic (zcbor::value_t (text)).c_str ());

    zcbor::bytes_t bytes;
    bytes.push_back (0x00);
    bytes.push_back (0xab);
    bytes.push_back (0xff);
    TEST_ASSERT_EQUAL_STRING (
      "h'00abff'", zcbor::to_diagnostic (zcbor::value_t (bytes)).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "h''", zcbor::to_diagnostic (zcbor::value_t (zcbor::bytes_t ())).c_str ());
}

void test_array_diagnostics ()
{
    zcbor::array_t inner;
    inner.push_back (zcbor::value_t (zcbor::integer_t (uint8_t (2))));
    inner.push_back (zcbor::value_t (std::string ("x")));

    zcbor::array_t outer;
    outer.push_back (zcbor::value_t (zcbor::integer_t (uint8_t (1))));
    outer.push_back (zcbor::value_t (inner));
    outer.push_back (zcbor::value_t (zcbor::null_t ()));

    TEST_ASSERT_EQUAL_STRING (
      "[1, [2, \"x\"], null]",
      zcbor::to_diagnostic (zcbor::value_t (outer)).c_str ());
}

void test_integer_widening ()
{
    TEST_ASSERT_TRUE (zcbor::to_int128 (zcbor::integer_t (uint16_t (65535)))
                      == 65535);
    TEST_ASSERT_TRUE (zcbor::to_int128 (zcbor::integer_t (int32_t (-7)))
                      == -7);
    TEST_ASSERT_FALSE (zcbor::is_null (zcbor::value_t (false)));
    TEST_ASSERT_TRUE (zcbor::is_null (zcbor::value_t (zcbor::null_t ())));
}

void test_kind_names ()
{
    TEST_ASSERT_EQUAL_STRING ("int", zcbor::kind_name (zcbor::kind_int));
    TEST_ASSERT_EQUAL_STRING ("bytes_array",
                              zcbor::kind_name (zcbor::kind_bytes_array));
    TEST_ASSERT_EQUAL_STRING ("string_array_end",
                              zcbor::kind_name (zcbor::kind_string_array_end));

    //  Headers without a payload print as their kind.
    TEST_ASSERT_EQUAL_STRING (
      "array_end",
      zcbor::to_diagnostic (zcbor::token_t (zcbor::kind_array_end)).c_str ());
}

void test_error_strings ()
{
    TEST_ASSERT_EQUAL_STRING ("Break without an open indefinite-length item",
                              zcbor_strerror (ZCBOR_EBREAK));
    TEST_ASSERT_EQUAL_STRING (strerror (EIO), zcbor_strerror (EIO));

    int major, minor, patch;
    zcbor_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (ZCBOR_VERSION,
                           ZCBOR_MAKE_VERSION (major, minor, patch));
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_float_diagnostics);
    RUN_TEST (test_half_precision_bits);
    RUN_TEST (test_scalar_diagnostics);
    RUN_TEST (test_string_diagnostics);
    RUN_TEST (test_array_diagnostics);
    RUN_TEST (test_integer_widening);
    RUN_TEST (test_kind_names);
    RUN_TEST (test_error_strings);

    return UNITY_END ();
}
