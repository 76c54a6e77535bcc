// SPDX-License-Identifier: Apache-2.0

#include <math.h> // log2(), lround()

#include "normalization.hh"

// mask index is the number of bits set, indexes 5 to 25 are the masks of the FastCDC 2020 paper
const uint64_t Normalization::Masks[NORMALIZATION_MASK_MAX_BITS + 1] = {
    0,                     // padding
    0,                     // padding
    0,                     // padding
    0,                     // padding
    0,                     // padding
    0x0000000001804110,    // used for level 3 only
    0x0000000001803110,    // 64B
    0x0000000018035100,    // 128B
    0x0000001800035300,    // 256B
    0x0000019000353000,    // 512B
    0x0000590003530000,    // 1KB
    0x0000d90003530000,    // 2KB
    0x0000d90103530000,    // 4KB
    0x0000d90303530000,    // 8KB
    0x0000d90313530000,    // 16KB
    0x0000d90f03530000,    // 32KB
    0x0000d90303537000,    // 64KB
    0x0000d90703537000,    // 128KB
    0x0000d90707537000,    // 256KB
    0x0000d91707537000,    // 512KB
    0x0000d91747537000,    // 1MB
    0x0000d91767537000,    // 2MB
    0x0000d93767537000,    // 4MB
    0x0000d93777537000,    // 8MB
    0x0000d93777577000,    // 16MB
    0x0000db3777577000,    // 32MB
    0x0000db3f77577000,    // 64MB
    0x0000db3f77777000,    // 128MB
    0x0000db3f777f7000,    // 256MB
    0x0000db7f777f7000,    // levels 1-3 above 256MB
    0x0000dbff777f7000,
    0x0000dbff777f7100,
};

NormalizationMasks Normalization::getMasks(length_t avgSize, NormalizationLevel level) {
    NormalizationMasks masks;
    int bits = logarithm2(avgSize);
    int shift = level < UNKNOWN_NORMALIZATION_LEVEL ? (int) level : 0;
    masks.maskSmall = getMask(bits + shift);
    masks.maskLarge = getMask(bits - shift);
    masks.splitPoint = avgSize;
    return masks;
}

uint64_t Normalization::getMask(int bits) {
    if (bits < NORMALIZATION_MASK_MIN_BITS || bits > NORMALIZATION_MASK_MAX_BITS)
        return 0;
    return Masks[bits];
}

int Normalization::logarithm2(length_t value) {
    return (int) lround(log2((double) value));
}
