/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_VALUE_HPP_INCLUDED__
#define __ZCBOR_VALUE_HPP_INCLUDED__

#include <stdint.h>

#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/variant.hpp>

namespace zcbor
{
typedef boost::multiprecision::int128_t int128_t;

//  Integers keep the width they were decoded with. Negative integers use
//  the narrowest signed type holding -(m+1), up to 128 bits.
typedef boost::variant<uint8_t,
                       uint16_t,
                       uint32_t,
                       uint64_t,
                       int8_t,
                       int16_t,
                       int32_t,
                       int64_t,
                       int128_t>
  integer_t;

typedef std::vector<unsigned char> bytes_t;

//  CBOR null and undefined both decode to this marker.
struct null_t
{
    bool operator== (const null_t &) const { return true; }
    bool operator!= (const null_t &) const { return false; }
};

typedef boost::make_recursive_variant<
  null_t,
  integer_t,
  bool,
  double,
  std::string,
  bytes_t,
  std::vector<boost::recursive_variant_> >::type value_t;

typedef std::vector<value_t> array_t;

//  Widens any decoded integer to 128 bits.
int128_t to_int128 (const integer_t &integer_);

bool is_null (const value_t &value_);

//  CBOR diagnostic notation (RFC 8949, section 8).
std::string to_diagnostic (const integer_t &integer_);
std::string to_diagnostic (const value_t &value_);

//  Helpers shared with token rendering.
std::string diagnostic_bytes (const unsigned char *data_, size_t size_);
std::string diagnostic_text (const char *data_, size_t size_);
}

#endif
