// SPDX-License-Identifier: Apache-2.0

#ifndef __FASTCDC_HH__
#define __FASTCDC_HH__

#include <stdint.h>

#include "chunker.hh"
#include "chunker_error.hh"
#include "gear.hh"
#include "normalization.hh"
#include "../../common/define.hh"
#include "../../ds/chunk.hh"

/**
 * FastCDC (2020) content-defined chunker
 *
 * The chunker keeps the rolling hash and the length of the current chunk across
 * calls to cut(), so a stream can be passed in buffers of any size and still yield
 * the cut points found when scanning the whole stream at once. At most one chunk is
 * returned per call; pass the bytes after cutpointInBuffer to the next call to find
 * the following chunks.
 *
 * Not thread-safe, each stream should be driven by one caller through its own instance.
 **/
class FastCDC : public DedupChunker {
public:

    /**
     * Chunks of one in-memory buffer
     *
     * Offsets and cut points of the chunks are positions in the buffer; the offset of
     * the first chunk is negative if the chunk started in data passed to earlier calls.
     **/
    class Iterator {
    public:
        Iterator(FastCDC *cdc, const data_t *data, length_t length);

        /**
         * Get the next chunk in the buffer
         *
         * @param[out] chunk               the next chunk
         *
         * @return whether a chunk is found, false once the buffer is exhausted
         **/
        bool next(Chunk &chunk);

        // bytes of the buffer that belong to chunks returned so far
        length_t getCursor() const {
            return _cursor;
        }

    private:
        FastCDC *_cdc;
        const data_t *_data;
        length_t _length;
        length_t _cursor;
        bool _done;
    };

    /**
     * Create a chunker with the default normalization level
     *
     * @param[in] minSize                  minimum chunk size
     * @param[in] avgSize                  average chunk size
     * @param[in] maxSize                  maximum chunk size
     *
     * @exception ChunkerConfigError if any size is out of its bounds, or minSize <= avgSize <= maxSize does not hold
     **/
    FastCDC(length_t minSize, length_t avgSize, length_t maxSize);

    /**
     * Create a chunker with a given normalization level and gear table seed
     *
     * @param[in] minSize                  minimum chunk size
     * @param[in] avgSize                  average chunk size
     * @param[in] maxSize                  maximum chunk size
     * @param[in] level                    normalization level
     * @param[in] seed                     seed XOR-ed into the gear table, 0 for the default table
     *
     * @exception ChunkerConfigError if any parameter is invalid
     **/
    FastCDC(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level, uint64_t seed = 0);

    ~FastCDC();

    /**
     * See DedupChunker::cut()
     *
     * Data beyond the declared content length is not scanned.
     **/
    bool cut(const data_t *data, length_t length, Chunk &chunk);

    /**
     * See DedupChunker::setContentLength()
     *
     * Once the bytes passed to cut() reach the content length, the remaining bytes
     * are cut as a final chunk, even if shorter than the minimum size.
     **/
    void setContentLength(offset_t length);

    /**
     * Iterate over the chunks of a buffer
     *
     * @param[in] data                     data buffer
     * @param[in] length                   length of the data buffer
     *
     * @return an iterator that cuts the buffer using this chunker
     **/
    Iterator iterate(const data_t *data, length_t length);

    /**
     * Check the chunk size parameters
     *
     * @exception ChunkerConfigError naming the first violated bound
     **/
    static void validate(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level = DEFAULT_NORMALIZATION_LEVEL);

    length_t getMinSize() const {
        return _minSize;
    }

    length_t getAvgSize() const {
        return _avgSize;
    }

    length_t getMaxSize() const {
        return _maxSize;
    }

    NormalizationLevel getNormalizationLevel() const {
        return _level;
    }

    NormalizationMasks getMasks() const {
        return _masks;
    }

    uint64_t getSeed() const {
        return _gear.getSeed();
    }

    bool hasContentLength() const {
        return _state.contentLength != INVALID_CONTENT_LENGTH;
    }

    offset_t getContentLength() const {
        return _state.contentLength;
    }

    // number of bytes scanned since construction
    offset_t getPosition() const {
        return _state.position;
    }

    // number of bytes scanned into the chunk not yet cut
    length_t getPendingLength() const {
        return _state.chunkLength;
    }

private:
    length_t _minSize;                         /**< minimum chunk size */
    length_t _avgSize;                         /**< average chunk size */
    length_t _maxSize;                         /**< maximum chunk size */
    NormalizationLevel _level;                 /**< normalization level */
    NormalizationMasks _masks;                 /**< masks derived from the average size and level */
    Gear _gear;                                /**< gear table */

    struct {
        uint64_t hash;                         /**< rolling hash of the current chunk */
        length_t chunkLength;                  /**< bytes scanned into the current chunk */
        offset_t position;                     /**< bytes scanned since construction */
        offset_t contentLength;                /**< declared stream length */
    } _state;

    void init(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level, uint64_t seed);

    /**
     * Tell the largest length of the current chunk
     *
     * @return the maximum size, or the bytes left before the content length if fewer
     **/
    offset_t getChunkLimit() const;

    void emitChunk(uint64_t hash, length_t consumed, length_t carried, Chunk &chunk);
};

#endif // define __FASTCDC_HH__
