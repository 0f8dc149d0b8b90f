/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_DEBUG_HPP_INCLUDED__
#define __ZCBOR_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Unified debug macros for decoder components
//  Enable with -DZCBOR_DEBUG=1 during compilation
//
//  Usage:
//    ZCBOR_DBG_CURSOR("refill: %zu bytes", bytes);
//    ZCBOR_DBG_TOKEN("header 0x%02x at %llu", byte, offset);
//    ZCBOR_DBG_LEXER("break closes %s", kind_name (kind));

#ifdef ZCBOR_DEBUG

#define ZCBOR_DBG(category, fmt, ...)                                          \
    do {                                                                       \
        fprintf (stderr, "[ZCBOR:" category "] " fmt "\n", ##__VA_ARGS__);     \
    } while (0)

#define ZCBOR_DBG_THIS(category, fmt, ...)                                     \
    do {                                                                       \
        fprintf (stderr, "[ZCBOR:" category ":%p] " fmt "\n",                  \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define ZCBOR_DBG(category, fmt, ...) ((void) 0)
#define ZCBOR_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define ZCBOR_DBG_SOURCE(fmt, ...) ZCBOR_DBG_THIS ("SOURCE", fmt, ##__VA_ARGS__)
#define ZCBOR_DBG_CURSOR(fmt, ...) ZCBOR_DBG_THIS ("CURSOR", fmt, ##__VA_ARGS__)
#define ZCBOR_DBG_TOKEN(fmt, ...) ZCBOR_DBG_THIS ("TOKEN", fmt, ##__VA_ARGS__)
#define ZCBOR_DBG_LEXER(fmt, ...) ZCBOR_DBG_THIS ("LEXER", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define ZCBOR_LOG_ERROR(fmt, ...) ZCBOR_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)

//  Global severity macros (without this pointer)
#define ZCBOR_GLOBAL_WARN(fmt, ...) ZCBOR_DBG ("WARN", fmt, ##__VA_ARGS__)

#endif
