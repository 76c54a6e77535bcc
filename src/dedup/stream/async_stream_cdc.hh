// SPDX-License-Identifier: Apache-2.0

#ifndef __ASYNC_STREAM_CDC_HH__
#define __ASYNC_STREAM_CDC_HH__

#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "async_byte_source.hh"
#include "../chunking/chunker.hh"
#include "../chunking/chunker_error.hh"
#include "../../common/define.hh"
#include "../../ds/byte_buffer.hh"
#include "../../ds/chunk.hh"

/**
 * Chunks of an asynchronous byte source
 *
 * Works like StreamCDC, except that the buffer is filled by asynchronous reads and
 * each chunk is delivered to a completion handler run by the I/O context. Chunks are
 * pulled one at a time. Destroying the wrapper cancels the reads of the source, and
 * the handler of a pending pull is never run.
 **/
class AsyncStreamCDC {
public:
    /**
     * Completion of a pull
     *
     * The error code is
     *  - success, with the bytes and absolute position of the next chunk,
     *  - boost::asio::error::eof at the end of stream,
     *  - the error code of the source if a read failed,
     *  - stream_errc::drain_overflow if the chunker cut beyond the buffered bytes.
     *
     * The bytes stay valid until the next pull completes; move them out to keep them.
     **/
    typedef boost::function<void (const boost::system::error_code &, ByteBuffer &, const Chunk &)> ChunkHandler;

    /**
     * @exception ChunkerConfigError if the chunking parameters are invalid
     **/
    AsyncStreamCDC(boost::asio::io_context &io, AsyncByteSource &source, length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level = DEFAULT_NORMALIZATION_LEVEL, uint64_t seed = 0);

    /**
     * @param[in] chunker                  chunker that has not scanned any data, the wrapper takes its ownership
     **/
    AsyncStreamCDC(boost::asio::io_context &io, AsyncByteSource &source, DedupChunker *chunker);

    /**
     * Reads still in flight keep the buffer until they complete; their results are dropped
     **/
    ~AsyncStreamCDC();

    /**
     * Start pulling the next chunk
     *
     * @param[in] handler                  completion handler, always posted to the I/O context
     *
     * @return whether the pull is started, false if another pull is pending
     **/
    bool asyncNextChunk(ChunkHandler handler);

    void setReadSize(length_t readSize) {
        _readSize = readSize;
    }

    offset_t getProcessed() const {
        return _processed;
    }

    bool isPending() const {
        return _pending;
    }

    bool isEndOfSource() const {
        return _endOfSource;
    }

private:
    // state shared with the operations in flight
    struct Guard {
        AsyncStreamCDC *owner;               /**< wrapper to complete, NULL once destroyed */
        ByteBuffer buffer;                   /**< bytes of the current chunk and after */
    };

    boost::asio::io_context &_io;            /**< context running the completions */
    AsyncByteSource &_source;                /**< source of bytes */
    DedupChunker *_chunker;                  /**< chunker owned by the wrapper */
    boost::shared_ptr<Guard> _guard;         /**< read buffer and owner of the operations */
    ByteBuffer &_buffer;                     /**< buffer of the guard */
    ByteBuffer _payload;                     /**< bytes of the last delivered chunk */
    offset_t _processed;                     /**< bytes drained from the buffer */
    length_t _scanned;                       /**< buffered bytes already passed to the chunker */
    length_t _readSize;                      /**< maximum bytes per read, 0 for no limit */
    bool _endOfSource;                       /**< whether the source reported its end */
    bool _pending;                           /**< whether a pull is in flight */
    boost::system::error_code _readError;    /**< error of the failed read */
    ChunkHandler _handler;                   /**< handler of the pending pull */

    void init();

    // issue a read into the free space of the buffer
    void readMore();
    void onRead(const boost::system::error_code &ec, std::size_t bytes);
    static void onGuardedRead(boost::shared_ptr<Guard> guard, const boost::system::error_code &ec, std::size_t bytes);

    // cut the buffered bytes and complete the pull
    void cutBuffer();

    // post the completion of the pending pull
    void complete(const boost::system::error_code &ec, const Chunk &chunk);
    void deliver(const boost::system::error_code &ec, const Chunk &chunk);
    static void onGuardedComplete(boost::shared_ptr<Guard> guard, const boost::system::error_code &ec, const Chunk &chunk);
};

#endif // define __ASYNC_STREAM_CDC_HH__
