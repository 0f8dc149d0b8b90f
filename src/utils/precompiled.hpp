/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZCBOR_PRECOMPILED_HPP_INCLUDED__
#define __ZCBOR_PRECOMPILED_HPP_INCLUDED__

#define __STDC_LIMIT_MACROS

// zcbor definitions and exported functions
#include "../include/zcbor.h"

// standard C headers
#include <errno.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// standard C++ headers
#include <string>
#include <vector>

#endif //ifndef __ZCBOR_PRECOMPILED_HPP_INCLUDED__
