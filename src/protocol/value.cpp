/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/value.hpp"

#include <cmath>
#include <cstdlib>

namespace
{
struct int128_visitor_t : public boost::static_visitor<zcbor::int128_t>
{
    template <typename T> zcbor::int128_t operator() (const T &value_) const
    {
        return zcbor::int128_t (value_);
    }
};

//  Shortest representation that reads back to the same double, in fixed
//  notation for decimal exponents from -4 to 15.
std::string format_double (double value_)
{
    if (std::isnan (value_))
        return "NaN";
    if (std::isinf (value_))
        return value_ < 0 ? "-Infinity" : "Infinity";

    char buf[40];
    int precision = 1;
    for (; precision <= 17; ++precision) {
        snprintf (buf, sizeof buf, "%.*e", precision - 1, value_);
        if (strtod (buf, NULL) == value_)
            break;
    }

    const int exponent = atoi (strchr (buf, 'e') + 1);
    if (exponent >= -4 && exponent < 16) {
        const int decimals =
          precision - 1 - exponent > 0 ? precision - 1 - exponent : 0;
        snprintf (buf, sizeof buf, "%.*f", decimals, value_);
    }

    //  Keep at least one fraction digit, before the exponent if any.
    std::string out (buf);
    if (out.find ('.') == std::string::npos) {
        const size_t exp_pos = out.find ('e');
        out.insert (exp_pos == std::string::npos ? out.size () : exp_pos,
                    ".0");
    }
    return out;
}

struct diagnostic_visitor_t : public boost::static_visitor<std::string>
{
    std::string operator() (const zcbor::null_t &) const { return "null"; }

    std::string operator() (const zcbor::integer_t &integer_) const
    {
        return zcbor::to_diagnostic (integer_);
    }

    std::string operator() (bool value_) const
    {
        return value_ ? "true" : "false";
    }

    std::string operator() (double value_) const
    {
        return format_double (value_);
    }

    std::string operator() (const std::string &text_) const
    {
        return zcbor::diagnostic_text (text_.data (), text_.size ());
    }

    std::string operator() (const zcbor::bytes_t &bytes_) const
    {
        return zcbor::diagnostic_bytes (bytes_.empty () ? NULL : &bytes_[0],
                                        bytes_.size ());
    }

    std::string operator() (const zcbor::array_t &array_) const
    {
        std::string out ("[");
        for (size_t i = 0; i < array_.size (); ++i) {
            if (i > 0)
                out += ", ";
            out += boost::apply_visitor (*this, array_[i]);
        }
        out += "]";
        return out;
    }
};
}

zcbor::int128_t zcbor::to_int128 (const integer_t &integer_)
{
    return boost::apply_visitor (int128_visitor_t (), integer_);
}

bool zcbor::is_null (const value_t &value_)
{
    return boost::get<null_t> (&value_) != NULL;
}

std::string zcbor::to_diagnostic (const integer_t &integer_)
{
    return to_int128 (integer_).str ();
}

std::string zcbor::to_diagnostic (const value_t &value_)
{
    return boost::apply_visitor (diagnostic_visitor_t (), value_);
}

std::string zcbor::diagnostic_bytes (const unsigned char *data_, size_t size_)
{
    static const char hex[] = "0123456789abcdef";

    std::string out ("h'");
    out.reserve (size_ * 2 + 3);
    for (size_t i = 0; i < size_; ++i) {
        out += hex[data_[i] >> 4];
        out += hex[data_[i] & 0x0f];
    }
    out += "'";
    return out;
}

std::string zcbor::diagnostic_text (const char *data_, size_t size_)
{
    std::string out ("\"");
    out.reserve (size_ + 2);
    for (size_t i = 0; i < size_; ++i) {
        const unsigned char c = static_cast<unsigned char> (data_[i]);
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20) {
                    char esc[8];
                    snprintf (esc, sizeof esc, "\\u%04x", c);
                    out += esc;
                } else {
                    out += static_cast<char> (c);
                }
        }
    }
    out += "\"";
    return out;
}
