/* SPDX-License-Identifier: MPL-2.0 */

/******************************************************************************/
/*  zcbor Internal Use                                                        */
/******************************************************************************/

#define LIBZCBOR_UNUSED(object) (void) object

/******************************************************************************/

#if !defined ZCBOR_OVERRIDE
#if defined ZCBOR_HAVE_NOEXCEPT
#define ZCBOR_OVERRIDE override
#else
#define ZCBOR_OVERRIDE
#endif
#endif

#if !defined ZCBOR_FINAL
#if defined ZCBOR_HAVE_NOEXCEPT
#define ZCBOR_FINAL final
#else
#define ZCBOR_FINAL
#endif
#endif

#if !defined ZCBOR_DEFAULT
#if defined ZCBOR_HAVE_NOEXCEPT
#define ZCBOR_DEFAULT = default;
#else
#define ZCBOR_DEFAULT                                                          \
    {                                                                          \
    }
#endif
#endif

#if !defined ZCBOR_NON_COPYABLE_NOR_MOVABLE
#if defined ZCBOR_HAVE_NOEXCEPT
#define ZCBOR_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define ZCBOR_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  private:                                                                     \
    classname (const classname &);                                            \
    classname &operator= (const classname &);
#endif
#endif
