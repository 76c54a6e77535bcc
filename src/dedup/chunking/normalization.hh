// SPDX-License-Identifier: Apache-2.0

#ifndef __NORMALIZATION_HH__
#define __NORMALIZATION_HH__

#include <stdint.h>

#include "../../common/define.hh"

#define NORMALIZATION_MASK_MIN_BITS  (5)
#define NORMALIZATION_MASK_MAX_BITS  (31)

/**
 * Masks for normalized chunking
 *
 * The small mask (more bits) is used before the split point and the large mask
 * (fewer bits) after it, pulling cut points towards the split point.
 **/
struct NormalizationMasks {
    uint64_t maskSmall;          /**< mask applied before the split point */
    uint64_t maskLarge;          /**< mask applied after the split point */
    length_t splitPoint;         /**< chunk length where the masks switch */

    NormalizationMasks() {
        maskSmall = 0;
        maskLarge = 0;
        splitPoint = 0;
    }
};

class Normalization {
public:
    /**
     * Derive the masks for an average chunk size
     *
     * @param[in] avgSize                  average chunk size
     * @param[in] level                    normalization level
     *
     * @return masks for the average size and level
     **/
    static NormalizationMasks getMasks(length_t avgSize, NormalizationLevel level);

    /**
     * Get the mask with a given number of bits set
     *
     * @param[in] bits                     number of bits, within NORMALIZATION_MASK_MIN_BITS and NORMALIZATION_MASK_MAX_BITS
     *
     * @return the mask, or 0 if the number of bits is out of range
     **/
    static uint64_t getMask(int bits);

    /**
     * Round log2 of a value to the nearest integer
     **/
    static int logarithm2(length_t value);

private:
    static const uint64_t Masks[NORMALIZATION_MASK_MAX_BITS + 1];
};

#endif // define __NORMALIZATION_HH__
