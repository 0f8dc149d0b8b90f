/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "io/fd_source.hpp"
#include "utils/debug.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include <climits>

zcbor::fd_source_t::fd_source_t (fd_t fd_, bool owned_) :
    _descriptor (new boost::asio::posix::stream_descriptor (_io_context)),
    _owned (owned_),
    _eof (false)
{
    boost::system::error_code ec;
    _descriptor->assign (fd_, ec);
    if (ec) {
        const int tmp_errno = ec.value ();
        ZCBOR_LOG_ERROR ("assign fd %d failed: %s", fd_,
                         ec.message ().c_str ());
        _descriptor.reset ();
        errno = tmp_errno;
    }
}

zcbor::fd_source_t::~fd_source_t ()
{
    if (!_descriptor)
        return;
    if (_owned) {
        boost::system::error_code ec;
        _descriptor->close (ec);
        if (ec)
            ZCBOR_LOG_ERROR ("close failed: %s", ec.message ().c_str ());
    } else {
        //  Hand the descriptor back to the caller untouched.
        _descriptor->release ();
    }
}

bool zcbor::fd_source_t::is_open () const
{
    return _descriptor && _descriptor->is_open ();
}

int zcbor::fd_source_t::read (unsigned char *buffer_, size_t size_)
{
    if (_eof || size_ == 0)
        return 0;

    if (!is_open ()) {
        errno = EBADF;
        return -1;
    }

    if (size_ > static_cast<size_t> (INT_MAX))
        size_ = static_cast<size_t> (INT_MAX);

    boost::system::error_code ec;
    std::size_t bytes_read = 0;
    do {
        bytes_read =
          _descriptor->read_some (boost::asio::buffer (buffer_, size_), ec);
    } while (ec == boost::asio::error::interrupted);

    if (ec) {
        if (ec == boost::asio::error::eof) {
            ZCBOR_DBG_SOURCE ("end of stream");
            _eof = true;
            return 0;
        }
        ZCBOR_LOG_ERROR ("read_some failed: %s", ec.message ().c_str ());
        if (ec == boost::asio::error::bad_descriptor) {
            errno = EBADF;
        } else {
            errno = EIO;
        }
        return -1;
    }

    ZCBOR_DBG_SOURCE ("read %zu bytes", bytes_read);
    return static_cast<int> (bytes_read);
}
