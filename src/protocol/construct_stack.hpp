/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_CONSTRUCT_STACK_HPP_INCLUDED__
#define __ZCBOR_CONSTRUCT_STACK_HPP_INCLUDED__

#include <stddef.h>

#include <vector>

#include "protocol/token.hpp"
#include "utils/macros.hpp"

namespace zcbor
{
//  Indefinite-length constructs opened and not yet closed by a break,
//  innermost last. Owned by exactly one decode session.
class construct_stack_t
{
  public:
    construct_stack_t ();

    //  kind_ must be kind_array, kind_bytes_array or kind_string_array.
    void push (kind_t kind_);

    //  Removes the innermost construct and stores its kind. Fails with
    //  ZCBOR_EBREAK if nothing is open.
    int pop (kind_t &kind_);

    size_t depth () const { return _kinds.size (); }
    bool empty () const { return _kinds.empty (); }

  private:
    std::vector<kind_t> _kinds;

    ZCBOR_NON_COPYABLE_NOR_MOVABLE (construct_stack_t)
};
}

#endif
