// SPDX-License-Identifier: Apache-2.0

#ifndef __DEFINE_HH__
#define __DEFINE_HH__

#include <stdint.h>

// internal variable types
typedef uint32_t                   length_t;
typedef uint64_t                   offset_t;
typedef int64_t                    soffset_t;
typedef unsigned char              data_t;

// constants
/// chunk size bounds
#define FASTCDC_MINIMUM_MIN        (length_t)(64)
#define FASTCDC_MINIMUM_MAX        (length_t)(67108864)      // 64MB
#define FASTCDC_AVERAGE_MIN        (length_t)(256)
#define FASTCDC_AVERAGE_MAX        (length_t)(268435456)     // 256MB
#define FASTCDC_MAXIMUM_MIN        (length_t)(1024)
#define FASTCDC_MAXIMUM_MAX        (length_t)(1073741824)    // 1GB
/// default chunk sizes
#define DEFAULT_AVERAGE_SIZE       (length_t)(16384)
/// stream
#define INVALID_CONTENT_LENGTH     (offset_t)(-1)

#define GEAR_TABLE_SIZE            (256)

// see also NormalizationLevelName in common/define.cc
enum NormalizationLevel {
    NORMALIZATION_LEVEL_0,          // 0, no normalization
    NORMALIZATION_LEVEL_1,
    NORMALIZATION_LEVEL_2,
    NORMALIZATION_LEVEL_3,

    UNKNOWN_NORMALIZATION_LEVEL
};

#define DEFAULT_NORMALIZATION_LEVEL NORMALIZATION_LEVEL_1

extern const char *NormalizationLevelName[];

#endif // define __DEFINE_HH__
