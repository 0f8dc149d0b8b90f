/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_FD_SOURCE_HPP_INCLUDED__
#define __ZCBOR_FD_SOURCE_HPP_INCLUDED__

#include "io/i_source.hpp"
#include "utils/macros.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <memory>

namespace zcbor
{
typedef int fd_t;

//  Streaming source reading a file, pipe or socket descriptor with
//  blocking reads. The descriptor is closed on destruction only when the
//  source owns it.
class fd_source_t ZCBOR_FINAL : public i_source
{
  public:
    explicit fd_source_t (fd_t fd_, bool owned_ = false);
    ~fd_source_t ();

    //  False if the descriptor could not be assigned; errno is set.
    bool is_open () const;

    int read (unsigned char *buffer_, size_t size_) ZCBOR_OVERRIDE;
    const char *name () const ZCBOR_OVERRIDE { return "fd_source"; }

  private:
    boost::asio::io_context _io_context;
    std::unique_ptr<boost::asio::posix::stream_descriptor> _descriptor;
    const bool _owned;
    bool _eof;

    ZCBOR_NON_COPYABLE_NOR_MOVABLE (fd_source_t)
};
}

#endif
