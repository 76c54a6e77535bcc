// SPDX-License-Identifier: Apache-2.0

#include <new>

#include <boost/bind/bind.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/placeholders.hpp>
#include <boost/asio/post.hpp>
#include <glog/logging.h>

#include "async_stream_cdc.hh"
#include "../chunking/fastcdc.hh"

AsyncStreamCDC::AsyncStreamCDC(boost::asio::io_context &io, AsyncByteSource &source, length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level, uint64_t seed) :
        _io(io), _source(source), _guard(new Guard()), _buffer(_guard->buffer) {
    _chunker = new FastCDC(minSize, avgSize, maxSize, level, seed);
    init();
}

AsyncStreamCDC::AsyncStreamCDC(boost::asio::io_context &io, AsyncByteSource &source, DedupChunker *chunker) :
        _io(io), _source(source), _guard(new Guard()), _buffer(_guard->buffer) {
    _chunker = chunker;
    init();
}

AsyncStreamCDC::~AsyncStreamCDC() {
    // completions still queued find no owner and are dropped
    _guard->owner = NULL;
    if (_pending) {
        LOG(WARNING) << "AsyncStreamCDC on " << _source.getName() << " destroyed with a pending pull, cancel the reads";
        _source.cancel();
    }
    delete _chunker;
}

void AsyncStreamCDC::init() {
    if (!_buffer.allocate(_chunker->getMaxSize())) {
        delete _chunker;
        throw std::bad_alloc();
    }
    _guard->owner = this;
    _processed = 0;
    _scanned = 0;
    _readSize = 0;
    _endOfSource = false;
    _pending = false;

    DLOG(INFO) << "AsyncStreamCDC init on " << _source.getName() << " with buffer of " << _buffer.capacity() << " bytes";
}

bool AsyncStreamCDC::asyncNextChunk(ChunkHandler handler) {
    if (_pending) {
        return false;
    }
    _pending = true;
    _handler = handler;

    if (_readError) {
        // the chunk sequence ends at the first failed read
        complete(_readError, Chunk());
    } else if (_endOfSource || _buffer.full()) {
        cutBuffer();
    } else {
        readMore();
    }
    return true;
}

void AsyncStreamCDC::readMore() {
    length_t request = _buffer.space();
    if (_readSize > 0 && request > _readSize)
        request = _readSize;

    _source.asyncRead(
        _buffer.tail(),
        request,
        boost::bind(
            &AsyncStreamCDC::onGuardedRead,
            _guard,
            boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred
        )
    );
}

void AsyncStreamCDC::onGuardedRead(boost::shared_ptr<Guard> guard, const boost::system::error_code &ec, std::size_t bytes) {
    if (guard->owner == NULL) {
        DLOG(INFO) << "Drop a read of " << bytes << " bytes completed after the stream is destroyed (" << ec.message() << ")";
        return;
    }
    guard->owner->onRead(ec, bytes);
}

void AsyncStreamCDC::onRead(const boost::system::error_code &ec, std::size_t bytes) {
    if (ec) {
        LOG(ERROR) << "Failed to read from " << _source.getName() << " at offset " << _processed + _buffer.length() << ", " << ec.message();
        _readError = ec;
        complete(ec, Chunk());
        return;
    }

    if (bytes == 0) {
        // the stream ends with the buffered bytes
        _endOfSource = true;
        _chunker->setContentLength(_processed + _buffer.length());
        cutBuffer();
        return;
    }

    if (!_buffer.grow((length_t) bytes)) {
        LOG(ERROR) << "Source " << _source.getName() << " returned " << bytes << " bytes for " << _buffer.space() << " bytes of free space";
        complete(boost::asio::error::no_buffer_space, Chunk());
        return;
    }

    if (_buffer.full()) {
        cutBuffer();
    } else {
        readMore();
    }
}

void AsyncStreamCDC::cutBuffer() {
    if (_buffer.empty()) {
        complete(boost::asio::error::eof, Chunk());
        return;
    }

    Chunk found;
    if (!_chunker->cut(_buffer.data() + _scanned, _buffer.length() - _scanned, found)) {
        _scanned = _buffer.length();
        LOG(WARNING) << "No cut point in the last " << _buffer.length() << " bytes of " << _source.getName();
        complete(boost::asio::error::eof, Chunk());
        return;
    }

    offset_t length = found.getLength();
    if (length > _buffer.length()) {
        LOG(ERROR) << "Chunk of " << length << " bytes exceeds the " << _buffer.length() << " buffered bytes";
        complete(stream_errc::drain_overflow, Chunk());
        return;
    }
    if (!_buffer.drainFront((length_t) length, _payload)) {
        complete(boost::asio::error::no_memory, Chunk());
        return;
    }

    Chunk chunk(found.hash, (soffset_t) _processed, _processed + length, (length_t) length);
    _processed += length;
    _scanned = 0;

    complete(boost::system::error_code(), chunk);
}

void AsyncStreamCDC::complete(const boost::system::error_code &ec, const Chunk &chunk) {
    boost::asio::post(_io, boost::bind(&AsyncStreamCDC::onGuardedComplete, _guard, ec, chunk));
}

void AsyncStreamCDC::onGuardedComplete(boost::shared_ptr<Guard> guard, const boost::system::error_code &ec, const Chunk &chunk) {
    if (guard->owner == NULL) {
        return;
    }
    guard->owner->deliver(ec, chunk);
}

void AsyncStreamCDC::deliver(const boost::system::error_code &ec, const Chunk &chunk) {
    // release the pull before running the handler, so that it can pull again
    ChunkHandler handler = _handler;
    _handler.clear();
    _pending = false;
    if (ec)
        _payload.clear();
    handler(ec, _payload, chunk);
}
