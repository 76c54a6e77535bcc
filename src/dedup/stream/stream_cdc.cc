// SPDX-License-Identifier: Apache-2.0

#include <errno.h>
#include <string.h> // strerror()
#include <new>

#include <glog/logging.h>

#include "stream_cdc.hh"
#include "../chunking/fastcdc.hh"

StreamCDC::StreamCDC(ByteSource &source, length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level, uint64_t seed) :
        _source(source) {
    _chunker = new FastCDC(minSize, avgSize, maxSize, level, seed);
    init();
}

StreamCDC::StreamCDC(ByteSource &source, DedupChunker *chunker) :
        _source(source) {
    _chunker = chunker;
    init();
}

StreamCDC::~StreamCDC() {
    delete _chunker;
}

void StreamCDC::init() {
    if (!_buffer.allocate(_chunker->getMaxSize())) {
        delete _chunker;
        throw std::bad_alloc();
    }
    _processed = 0;
    _scanned = 0;
    _readSize = 0;
    _endOfSource = false;
    _readErrno = 0;

    DLOG(INFO) << "StreamCDC init on " << _source.getName() << " with buffer of " << _buffer.capacity() << " bytes";
}

void StreamCDC::fillBuffer() {
    while (!_buffer.full()) {
        length_t request = _buffer.space();
        if (_readSize > 0 && request > _readSize)
            request = _readSize;

        long bytes = _source.read(_buffer.tail(), request);
        if (bytes < 0) {
            _readErrno = errno;
            LOG(ERROR) << "Failed to read from " << _source.getName() << " at offset " << _processed + _buffer.length() << ", " << strerror(_readErrno);
            throw StreamIOError(std::string("Failed to read from ").append(_source.getName()), _readErrno);
        }
        if (bytes == 0) {
            // the stream ends with the buffered bytes
            _endOfSource = true;
            _chunker->setContentLength(_processed + _buffer.length());
            break;
        }
        if (!_buffer.grow((length_t) bytes)) {
            throw StreamBufferError((length_t) bytes, _buffer.space());
        }
    }
}

bool StreamCDC::nextChunk(ByteBuffer &data, Chunk &chunk) {
    // the chunk sequence ends at the first failed read
    if (_readErrno != 0)
        throw StreamIOError(std::string("Failed to read from ").append(_source.getName()), _readErrno);

    if (!_endOfSource)
        fillBuffer();

    if (_buffer.empty())
        return false;

    Chunk found;
    if (!_chunker->cut(_buffer.data() + _scanned, _buffer.length() - _scanned, found)) {
        _scanned = _buffer.length();
        LOG(WARNING) << "No cut point in the last " << _buffer.length() << " bytes of " << _source.getName();
        return false;
    }

    offset_t length = found.getLength();
    if (length > _buffer.length()) {
        throw StreamBufferError((length_t) length, _buffer.length());
    }
    if (!_buffer.drainFront((length_t) length, data)) {
        throw std::bad_alloc();
    }

    chunk.set(found.hash, (soffset_t) _processed, _processed + length, (length_t) length);
    _processed += length;
    _scanned = 0;

    return true;
}
