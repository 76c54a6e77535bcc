// SPDX-License-Identifier: Apache-2.0

#ifndef __BYTE_SOURCE_HH__
#define __BYTE_SOURCE_HH__

#include <string>

#include "../../common/define.hh"

/**
 * Blocking source of bytes for a stream chunker
 **/
class ByteSource {
public:
    ByteSource() {};
    virtual ~ByteSource() {};

    /**
     * Read bytes from the source, blocks until some bytes are available
     *
     * @param[out] buf                     buffer to hold the bytes
     * @param[in] length                   size of the buffer
     *
     * @return number of bytes read, 0 at the end of source, or -1 on failure with errno set
     **/
    virtual long read(data_t *buf, length_t length) = 0;

    /**
     * Tell the name of the source (for error reporting)
     **/
    virtual std::string getName() const = 0;
};

/**
 * Bytes of a file or any other readable descriptor
 **/
class FileSource : public ByteSource {
public:
    /**
     * Open a file for reading
     *
     * @param[in] path                     path of the file
     *
     * @exception StreamIOError if the file cannot be opened
     **/
    FileSource(const std::string &path);

    /**
     * Read from an opened descriptor
     *
     * @param[in] fd                       readable descriptor
     * @param[in] closeOnDestroy           whether to close the descriptor upon destruction
     **/
    FileSource(int fd, bool closeOnDestroy = false);

    ~FileSource();

    long read(data_t *buf, length_t length);

    std::string getName() const {
        return _name;
    }

private:
    int _fd;                                /**< file descriptor */
    bool _closeOnDestroy;                   /**< whether the descriptor is owned */
    std::string _name;                      /**< file path or descriptor number */
};

/**
 * Bytes of an in-memory buffer
 **/
class MemorySource : public ByteSource {
public:
    /**
     * @param[in] data                     bytes to provide, must outlive the source
     * @param[in] length                   number of bytes
     * @param[in] maxReadSize              maximum bytes returned by one read, 0 for no limit
     **/
    MemorySource(const data_t *data, offset_t length, length_t maxReadSize = 0);

    long read(data_t *buf, length_t length);

    std::string getName() const {
        return "memory";
    }

    // number of bytes read so far
    offset_t getOffset() const {
        return _offset;
    }

private:
    const data_t *_data;
    offset_t _length;
    offset_t _offset;
    length_t _maxReadSize;
};

#endif // define __BYTE_SOURCE_HH__
