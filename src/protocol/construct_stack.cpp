/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/construct_stack.hpp"
#include "utils/err.hpp"

zcbor::construct_stack_t::construct_stack_t ()
{
}

void zcbor::construct_stack_t::push (kind_t kind_)
{
    zcbor_assert (is_opener (kind_));
    _kinds.push_back (kind_);
}

int zcbor::construct_stack_t::pop (kind_t &kind_)
{
    if (unlikely (_kinds.empty ())) {
        errno = ZCBOR_EBREAK;
        return -1;
    }
    kind_ = _kinds.back ();
    _kinds.pop_back ();
    return 0;
}
