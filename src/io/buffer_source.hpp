/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_BUFFER_SOURCE_HPP_INCLUDED__
#define __ZCBOR_BUFFER_SOURCE_HPP_INCLUDED__

#include "io/i_source.hpp"
#include "utils/macros.hpp"

namespace zcbor
{
//  Source over a caller-owned memory block. The block must outlive the
//  source; no copy is made.
class buffer_source_t ZCBOR_FINAL : public i_source
{
  public:
    buffer_source_t (const void *data_, size_t size_);

    int read (unsigned char *buffer_, size_t size_) ZCBOR_OVERRIDE;
    const char *name () const ZCBOR_OVERRIDE { return "buffer_source"; }

    size_t remaining () const { return _size - _pos; }

  private:
    const unsigned char *const _data;
    const size_t _size;
    size_t _pos;

    ZCBOR_NON_COPYABLE_NOR_MOVABLE (buffer_source_t)
};
}

#endif
