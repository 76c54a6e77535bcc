// SPDX-License-Identifier: Apache-2.0

#ifndef __DEDUP_CHUNKER_HH__
#define __DEDUP_CHUNKER_HH__

#include "../../common/define.hh"
#include "../../ds/chunk.hh"

class DedupChunker {
public:
    DedupChunker() {};
    virtual ~DedupChunker() {};

    /**
     * Find the next cut point, continuing from the data passed in previous calls
     *
     * @param[in] data                     data buffer
     * @param[in] length                   length of the data buffer
     * @param[out] chunk                   the chunk ending at the cut point, if found
     *
     * @return whether a cut point is found
     **/
    virtual bool cut(const data_t *data, length_t length, Chunk &chunk) = 0;

    /**
     * Declare the total number of bytes of the stream
     *
     * @param[in] length                   total number of bytes the stream will provide
     **/
    virtual void setContentLength(offset_t length) = 0;

    virtual length_t getMinSize() const = 0;
    virtual length_t getAvgSize() const = 0;
    virtual length_t getMaxSize() const = 0;

protected:
};

#endif // define __DEDUP_CHUNKER_HH__
