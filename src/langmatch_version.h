#ifndef SRC_LANGMATCH_VERSION_H_
#define SRC_LANGMATCH_VERSION_H_

#define LANGMATCH_MAJOR_VERSION 1
#define LANGMATCH_MINOR_VERSION 0
#define LANGMATCH_PATCH_VERSION 0

#define LANGMATCH_VERSION_IS_RELEASE 0

#ifndef LANGMATCH_STRINGIFY
#define LANGMATCH_STRINGIFY(n) LANGMATCH_STRINGIFY_HELPER(n)
#define LANGMATCH_STRINGIFY_HELPER(n) #n
#endif

#ifndef LANGMATCH_TAG
# if LANGMATCH_VERSION_IS_RELEASE
#  define LANGMATCH_TAG ""
# else
#  define LANGMATCH_TAG "-pre"
# endif
#endif

# define LANGMATCH_VERSION_STRING                                              \
    LANGMATCH_STRINGIFY(LANGMATCH_MAJOR_VERSION) "."                           \
    LANGMATCH_STRINGIFY(LANGMATCH_MINOR_VERSION) "."                           \
    LANGMATCH_STRINGIFY(LANGMATCH_PATCH_VERSION) LANGMATCH_TAG

#define LANGMATCH_VERSION "v" LANGMATCH_VERSION_STRING

#endif  // SRC_LANGMATCH_VERSION_H_
