/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_H_INCLUDED__
#define __ZCBOR_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define ZCBOR_VERSION_MAJOR 0
#define ZCBOR_VERSION_MINOR 3
#define ZCBOR_VERSION_PATCH 0

#define ZCBOR_MAKE_VERSION(major, minor, patch)                                \
    ((major) *10000 + (minor) *100 + (patch))
#define ZCBOR_VERSION                                                          \
    ZCBOR_MAKE_VERSION (ZCBOR_VERSION_MAJOR, ZCBOR_VERSION_MINOR,             \
                        ZCBOR_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#if !defined _WIN32_WCE
#include <errno.h>
#endif
#include <stddef.h>

/*  Handle DSO symbol visibility                                             */
#if defined ZCBOR_NO_EXPORT
#define ZCBOR_EXPORT
#else
#if defined _WIN32
#if defined ZCBOR_STATIC
#define ZCBOR_EXPORT
#elif defined DLL_EXPORT
#define ZCBOR_EXPORT __declspec(dllexport)
#else
#define ZCBOR_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define ZCBOR_EXPORT __attribute__ ((visibility ("default")))
#else
#define ZCBOR_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  zcbor errors.                                                             */
/******************************************************************************/
#define ZCBOR_HAUSNUMERO 156385712

/*  Fewer bytes available than a declared width or length requires.           */
#define ZCBOR_ETRUNCATED (ZCBOR_HAUSNUMERO + 1)
/*  Declared length or count exceeds the maximum representable count.         */
#define ZCBOR_ESIZE (ZCBOR_HAUSNUMERO + 2)
/*  Leading byte outside the dispatched ranges.                               */
#define ZCBOR_EBADBYTE (ZCBOR_HAUSNUMERO + 3)
/*  Break byte with no open indefinite-length construct.                      */
#define ZCBOR_EBREAK (ZCBOR_HAUSNUMERO + 4)
/*  Chunk kind differs from its enclosing chunked string.                     */
#define ZCBOR_EMIXED (ZCBOR_HAUSNUMERO + 5)
/*  Input exhausted while a construct remains open.                           */
#define ZCBOR_EEOF (ZCBOR_HAUSNUMERO + 6)
/*  Aggregates nested deeper than the configured limit.                       */
#define ZCBOR_EDEPTH (ZCBOR_HAUSNUMERO + 7)

/**
 * @brief Return the errno for the current thread.
 * @return errno value (POSIX errno or ZCBOR_HAUSNUMERO-based extended code).
 */
ZCBOR_EXPORT int zcbor_errno (void);

/**
 * @brief Return a human-readable string for the given error number.
 * @param errnum_  Error number (e.g. return value of zcbor_errno()).
 * @return Static string pointer. Must not be modified or freed.
 */
ZCBOR_EXPORT const char *zcbor_strerror (int errnum_);

/**
 * @brief Return the runtime library version.
 * @param[out] major_  Major version.
 * @param[out] minor_  Minor version.
 * @param[out] patch_  Patch version.
 */
ZCBOR_EXPORT void zcbor_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Decoder limits.                                                           */
/******************************************************************************/

#define ZCBOR_MAX_SIZE 1
#define ZCBOR_MAX_DEPTH 2
#define ZCBOR_READ_BUFFER_SIZE 3

/*  Largest string length or array count accepted (32-bit signed maximum).    */
#define ZCBOR_MAX_SIZE_DFLT 0x7fffffff
#define ZCBOR_MAX_DEPTH_DFLT 512
#define ZCBOR_READ_BUFFER_SIZE_DFLT 8192
/*  Largest read-ahead block accepted.                                        */
#define ZCBOR_READ_BUFFER_SIZE_MAX (1024 * 1024)

#ifdef __cplusplus
}
#endif

#endif
