/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/token.hpp"
#include "utils/utf8.hpp"

const char *zcbor::kind_name (kind_t kind_)
{
    switch (kind_) {
        case kind_int:
            return "int";
        case kind_bytes:
            return "bytes";
        case kind_string:
            return "string";
        case kind_bool:
            return "bool";
        case kind_float:
            return "float";
        case kind_null:
            return "null";
        case kind_undefined:
            return "undefined";
        case kind_array:
            return "array";
        case kind_array_end:
            return "array_end";
        case kind_bytes_array:
            return "bytes_array";
        case kind_bytes_array_end:
            return "bytes_array_end";
        case kind_string_array:
            return "string_array";
        case kind_string_array_end:
            return "string_array_end";
    }
    return "unknown";
}

zcbor::value_t zcbor::value_of (const token_t &token_)
{
    if (token_.value)
        return *token_.value;
    return value_t (null_t ());
}

namespace
{
//  Renders each chunk of a chunked string separately. render_ advances
//  pos_ past the chunk it renders.
template <typename T, typename F>
std::string chunked_diagnostic (const T &data_,
                                const std::vector<uint32_t> &chunks_,
                                F render_)
{
    std::string out ("(_ ");
    size_t pos = 0;
    for (size_t i = 0; i < chunks_.size (); ++i) {
        if (i > 0)
            out += ", ";
        out += render_ (data_, pos, chunks_[i]);
    }
    out += ")";
    return out;
}

//  Byte chunk sizes count bytes.
std::string render_bytes_chunk (const zcbor::bytes_t &bytes_,
                                size_t &pos_,
                                size_t size_)
{
    if (size_ > bytes_.size () - pos_)
        size_ = bytes_.size () - pos_;
    const std::string out =
      zcbor::diagnostic_bytes (size_ > 0 ? &bytes_[pos_] : NULL, size_);
    pos_ += size_;
    return out;
}

//  Text chunk sizes count characters.
std::string render_text_chunk (const std::string &text_,
                               size_t &pos_,
                               size_t chars_)
{
    const size_t size =
      zcbor::utf8_advance (text_.data () + pos_, text_.size () - pos_, chars_);
    const std::string out = zcbor::diagnostic_text (text_.data () + pos_, size);
    pos_ += size;
    return out;
}
}

std::string zcbor::to_diagnostic (const token_t &token_)
{
    switch (token_.kind) {
        case kind_null:
            return "null";
        case kind_undefined:
            return "undefined";

        case kind_bytes:
            if (token_.chunks && token_.value) {
                const bytes_t *bytes = boost::get<bytes_t> (&*token_.value);
                if (bytes)
                    return chunked_diagnostic (*bytes, *token_.chunks,
                                               render_bytes_chunk);
            }
            break;

        case kind_string:
            if (token_.chunks && token_.value) {
                const std::string *text =
                  boost::get<std::string> (&*token_.value);
                if (text)
                    return chunked_diagnostic (*text, *token_.chunks,
                                               render_text_chunk);
            }
            break;

        case kind_array:
            if (token_.value && !token_.size) {
                const array_t *array = boost::get<array_t> (&*token_.value);
                if (array) {
                    std::string out ("[_ ");
                    for (size_t i = 0; i < array->size (); ++i) {
                        if (i > 0)
                            out += ", ";
                        out += to_diagnostic ((*array)[i]);
                    }
                    out += "]";
                    return out;
                }
            }
            break;

        default:
            break;
    }

    if (token_.value)
        return to_diagnostic (*token_.value);
    return kind_name (token_.kind);
}
