/* SPDX-License-Identifier: MPL-2.0 */

//  Prints every top-level CBOR item of a file, or of standard input, in
//  diagnostic notation, one item per line.
//
//  Usage: zcbor_dump [file]
//
//  Limits are taken from ZCBOR_MAX_SIZE, ZCBOR_MAX_DEPTH and
//  ZCBOR_READ_BUFFER_SIZE.

#include "utils/precompiled.hpp"
#include "core/options.hpp"
#include "io/fd_source.hpp"
#include "protocol/lexer.hpp"
#include "protocol/token.hpp"

#include <fcntl.h>
#include <unistd.h>

static int dump (zcbor::fd_source_t &source_, const char *label_)
{
    zcbor::lexer_t lexer (source_, zcbor::options_t::from_env ());

    zcbor::token_t token;
    int rc;
    while ((rc = lexer.read_next (token)) == 1)
        printf ("%s\n", zcbor::to_diagnostic (token).c_str ());

    if (rc == -1) {
        const int err = zcbor_errno ();
        fflush (stdout);
        fprintf (stderr, "%s: %s (header at offset %llu)\n", label_,
                 zcbor_strerror (err),
                 static_cast<unsigned long long> (lexer.token_offset ()));
        return 1;
    }
    return 0;
}

int main (int argc, char *argv[])
{
    if (argc > 2) {
        fprintf (stderr, "usage: %s [file]\n", argv[0]);
        return 2;
    }

    if (argc == 1) {
        zcbor::fd_source_t source (STDIN_FILENO);
        if (!source.is_open ()) {
            fprintf (stderr, "<stdin>: %s\n", zcbor_strerror (zcbor_errno ()));
            return 1;
        }
        return dump (source, "<stdin>");
    }

    const int fd = open (argv[1], O_RDONLY);
    if (fd == -1) {
        fprintf (stderr, "%s: %s\n", argv[1], zcbor_strerror (zcbor_errno ()));
        return 1;
    }

    zcbor::fd_source_t source (fd, true);
    if (!source.is_open ()) {
        const int err = zcbor_errno ();
        close (fd);
        fprintf (stderr, "%s: %s\n", argv[1], zcbor_strerror (err));
        return 1;
    }
    return dump (source, argv[1]);
}
