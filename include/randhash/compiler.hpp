#pragma once

#define RANDHASH_UNLIKELY(cond) (__builtin_expect(!!(cond), 0))

#ifdef RANDHASH_OPTLEVEL_0
#define RANDHASH_INLINE inline
#else
#define RANDHASH_INLINE __attribute__((always_inline)) inline
#endif
