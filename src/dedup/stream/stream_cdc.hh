// SPDX-License-Identifier: Apache-2.0

#ifndef __STREAM_CDC_HH__
#define __STREAM_CDC_HH__

#include "byte_source.hh"
#include "../chunking/chunker.hh"
#include "../chunking/chunker_error.hh"
#include "../../common/define.hh"
#include "../../ds/byte_buffer.hh"
#include "../../ds/chunk.hh"

/**
 * Chunks of a blocking byte source
 *
 * The wrapper keeps the bytes of the current chunk in a buffer of the maximum
 * chunk size, fills it from the source and drains one chunk per call to nextChunk().
 * Chunk offsets and cut points are absolute positions in the stream.
 **/
class StreamCDC {
public:
    /**
     * Chunk a source with a FastCDC chunker
     *
     * @param[in] source                   source of bytes, must outlive the wrapper
     * @param[in] minSize                  minimum chunk size
     * @param[in] avgSize                  average chunk size
     * @param[in] maxSize                  maximum chunk size
     * @param[in] level                    normalization level
     * @param[in] seed                     gear table seed
     *
     * @exception ChunkerConfigError if the chunking parameters are invalid
     **/
    StreamCDC(ByteSource &source, length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level = DEFAULT_NORMALIZATION_LEVEL, uint64_t seed = 0);

    /**
     * Chunk a source with a given chunker
     *
     * @param[in] source                   source of bytes, must outlive the wrapper
     * @param[in] chunker                  chunker that has not scanned any data, the wrapper takes its ownership
     **/
    StreamCDC(ByteSource &source, DedupChunker *chunker);

    ~StreamCDC();

    /**
     * Get the next chunk of the stream
     *
     * @param[out] data                    bytes of the chunk
     * @param[out] chunk                   absolute position of the chunk in the stream
     *
     * @return whether a chunk is returned, false at the end of stream
     *
     * @exception StreamIOError if the source fails, and on every call after the failure
     * @exception StreamBufferError if the chunker cuts beyond the buffered bytes
     **/
    bool nextChunk(ByteBuffer &data, Chunk &chunk);

    /**
     * Limit the number of bytes requested by one read
     *
     * @param[in] readSize                 maximum bytes per read, 0 to request all free space of the buffer
     **/
    void setReadSize(length_t readSize) {
        _readSize = readSize;
    }

    length_t getReadSize() const {
        return _readSize;
    }

    // number of bytes returned in chunks so far
    offset_t getProcessed() const {
        return _processed;
    }

    // number of bytes read but not yet returned
    length_t getBuffered() const {
        return _buffer.length();
    }

    bool isEndOfSource() const {
        return _endOfSource;
    }

    DedupChunker *getChunker() const {
        return _chunker;
    }

private:
    ByteSource &_source;                     /**< source of bytes */
    DedupChunker *_chunker;                  /**< chunker owned by the wrapper */
    ByteBuffer _buffer;                      /**< bytes of the current chunk and after */
    offset_t _processed;                     /**< bytes drained from the buffer */
    length_t _scanned;                       /**< buffered bytes already passed to the chunker */
    length_t _readSize;                      /**< maximum bytes per read */
    bool _endOfSource;                       /**< whether the source reported its end */
    int _readErrno;                          /**< errno of the failed read, 0 if none */

    void init();

    /**
     * Read from the source until the buffer is full or the source ends
     *
     * @exception StreamIOError if the source fails
     **/
    void fillBuffer();
};

#endif // define __STREAM_CDC_HH__
