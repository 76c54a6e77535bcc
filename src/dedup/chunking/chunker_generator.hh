// SPDX-License-Identifier: Apache-2.0

#ifndef __CHUNKER_GENERATOR_HH__
#define __CHUNKER_GENERATOR_HH__

#include <glog/logging.h>

#include "fastcdc.hh"
#include "../../common/config.hh"

class ChunkerGenerator {
public:

    /* generate chunker instance for a particular set of chunk sizes, normalization level and gear seed */
    static FastCDC *genChunker(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level = DEFAULT_NORMALIZATION_LEVEL, uint64_t seed = 0) {
        try {
            return new FastCDC(minSize, avgSize, maxSize, level, seed);
        } catch (ChunkerConfigError &e) {
            LOG(ERROR) << "Failed to init chunker, " << e.what();
            return 0;
        }
        return 0;
    }

    /* generate chunker instance using the chunking settings in the configuration */
    static FastCDC *genChunker(const Config &config) {
        return genChunker(
            config.getMinChunkSize(),
            config.getAvgChunkSize(),
            config.getMaxChunkSize(),
            config.getNormalizationLevel(),
            config.getGearSeed()
        );
    }

protected:

};

#endif // define __CHUNKER_GENERATOR_HH__
