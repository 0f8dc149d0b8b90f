/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_TESTUTIL_HPP_INCLUDED__
#define __ZCBOR_TESTUTIL_HPP_INCLUDED__

#include "utils/precompiled.hpp"
#include "core/options.hpp"
#include "io/buffer_source.hpp"
#include "protocol/lexer.hpp"
#include "protocol/token.hpp"

#include <unity.h>

#include <string>
#include <vector>

#if !defined _WIN32
#include <unistd.h>
#endif

//  Tests that hang are killed after this many seconds.
#define ZCBOR_TEST_TIMEOUT 60

inline void setup_test_environment (int timeout_seconds_ = ZCBOR_TEST_TIMEOUT)
{
#if !defined _WIN32
    alarm (timeout_seconds_);
#else
    LIBZCBOR_UNUSED (timeout_seconds_);
#endif
}

//  Outcome of decoding a whole input: the diagnostic form of every item
//  read, the return code that ended the loop and errno when it was -1.
struct decode_result_t
{
    std::vector<std::string> items;
    int rc;
    int err;
};

inline decode_result_t decode_all (const unsigned char *data_,
                                   size_t size_,
                                   const zcbor::options_t &options_ =
                                     zcbor::options_t ())
{
    zcbor::buffer_source_t source (data_, size_);
    zcbor::lexer_t lexer (source, options_);

    decode_result_t result;
    zcbor::token_t token;
    while ((result.rc = lexer.read_next (token)) == 1)
        result.items.push_back (zcbor::to_diagnostic (token));
    result.err = result.rc == -1 ? errno : 0;
    return result;
}

//  Decodes the single item in data_ and returns its diagnostic form.
inline std::string decode_one (const unsigned char *data_, size_t size_)
{
    const decode_result_t result = decode_all (data_, size_);
    TEST_ASSERT_EQUAL_INT (0, result.rc);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (result.items.size ()));
    return result.items[0];
}

//  Decodes data_ expecting the session to end with errno_.
inline void assert_decode_fails (const unsigned char *data_,
                                 size_t size_,
                                 int errno_,
                                 const zcbor::options_t &options_ =
                                   zcbor::options_t ())
{
    const decode_result_t result = decode_all (data_, size_, options_);
    TEST_ASSERT_EQUAL_INT (-1, result.rc);
    TEST_ASSERT_EQUAL_STRING (zcbor_strerror (errno_),
                              zcbor_strerror (result.err));
    TEST_ASSERT_EQUAL_INT (errno_, result.err);
}

#endif
