// SPDX-License-Identifier: Apache-2.0

#ifndef __BYTE_BUFFER_HH__
#define __BYTE_BUFFER_HH__

#include <string.h> // memcpy(), memmove()
#include <new>
#include <glog/logging.h>

#include "../common/define.hh"

/**
 * Byte buffer of a fixed capacity
 *
 * The first length() bytes hold data; the rest of the capacity is free space that
 * can be filled through tail() and grow(). drainFront() removes bytes from the front
 * and shifts the remaining ones back to the start of the buffer.
 **/
class ByteBuffer {
public:

    ByteBuffer() {
        reset();
    }

    ByteBuffer(length_t capacity) {
        reset();
        allocate(capacity);
    }

    ~ByteBuffer() {
        release();
    }

    ByteBuffer(ByteBuffer &&src) {
        reset();
        take(src);
    }

    ByteBuffer& operator=(ByteBuffer &&src) {
        if (this != &src) {
            release();
            take(src);
        }
        return *this;
    }

    /**
     * Replace the content with a copy of the given bytes, the capacity becomes the number of bytes
     *
     * @param[in] data                     bytes to copy
     * @param[in] length                   number of bytes to copy
     *
     * @return whether the bytes are copied
     **/
    bool assign(const data_t *data, length_t length) {
        if (_capacity != length && !allocate(length)) {
            return false;
        }
        if (length > 0) {
            memcpy(_data, data, length);
        }
        _length = length;
        return true;
    }

    /**
     * Allocate an empty buffer, any existing content is dropped
     *
     * @param[in] capacity                 capacity of the new buffer
     *
     * @return whether the buffer is allocated, the old buffer is kept otherwise
     **/
    bool allocate(length_t capacity) {
        data_t *newData = new (std::nothrow) data_t[capacity > 0 ? capacity : 1];
        if (newData == NULL) {
            LOG(ERROR) << "Failed to allocate buffer of size " << capacity;
            return false;
        }
        release();
        _data = newData;
        _capacity = capacity;
        return true;
    }

    void release() {
        delete [] _data;
        reset();
    }

    // start of the free space
    data_t *tail() {
        return _data + _length;
    }

    // size of the free space
    length_t space() const {
        return _capacity - _length;
    }

    /**
     * Account for bytes written into the free space
     *
     * @param[in] count                    number of bytes written to tail()
     *
     * @return whether the count fits in the free space
     **/
    bool grow(length_t count) {
        if (count > space()) {
            return false;
        }
        _length += count;
        return true;
    }

    /**
     * Move bytes from the front of the buffer to another buffer
     *
     * @param[in] count                    number of bytes to remove from the front
     * @param[out] out                     buffer holding the removed bytes
     *
     * @return whether the bytes are drained, false if count exceeds the buffered length or out cannot be allocated
     **/
    bool drainFront(length_t count, ByteBuffer &out) {
        if (count > _length || !out.assign(_data, count)) {
            return false;
        }
        if (count < _length) {
            memmove(_data, _data + count, _length - count);
        }
        _length -= count;
        return true;
    }

    void clear() {
        _length = 0;
    }

    data_t *data() {
        return _data;
    }

    const data_t *data() const {
        return _data;
    }

    length_t length() const {
        return _length;
    }

    length_t capacity() const {
        return _capacity;
    }

    bool empty() const {
        return _length == 0;
    }

    bool full() const {
        return _length == _capacity;
    }

private:
    data_t *_data;
    length_t _capacity;
    length_t _length;

    void reset() {
        _data = NULL;
        _capacity = 0;
        _length = 0;
    }

    void take(ByteBuffer &src) {
        _data = src._data;
        _capacity = src._capacity;
        _length = src._length;
        src.reset();
    }

    // not copyable, use assign()
    ByteBuffer(const ByteBuffer &src);
    ByteBuffer& operator=(const ByteBuffer &src);
};

#endif // define __BYTE_BUFFER_HH__
