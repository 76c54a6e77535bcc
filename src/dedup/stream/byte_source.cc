// SPDX-License-Identifier: Apache-2.0

#include <errno.h>
#include <fcntl.h>     // open()
#include <string.h>    // memcpy()
#include <sys/stat.h>  // open()
#include <sys/types.h> // open()
#include <unistd.h>    // read(), close()

#include <glog/logging.h>

#include "byte_source.hh"
#include "../chunking/chunker_error.hh"

FileSource::FileSource(const std::string &path) {
    _fd = open(path.c_str(), O_RDONLY);
    if (_fd == -1) {
        throw StreamIOError(std::string("Failed to open file ").append(path), errno);
    }
    _closeOnDestroy = true;
    _name = path;
}

FileSource::FileSource(int fd, bool closeOnDestroy) {
    _fd = fd;
    _closeOnDestroy = closeOnDestroy;
    _name = std::string("fd:").append(std::to_string(fd));
}

FileSource::~FileSource() {
    if (_closeOnDestroy && _fd != -1 && close(_fd) != 0) {
        LOG(WARNING) << "Failed to close " << _name << ", " << strerror(errno);
    }
}

long FileSource::read(data_t *buf, length_t length) {
    ssize_t ret = 0;
    do {
        ret = ::read(_fd, buf, length);
    } while (ret == -1 && errno == EINTR);
    return ret;
}

MemorySource::MemorySource(const data_t *data, offset_t length, length_t maxReadSize) {
    _data = data;
    _length = length;
    _offset = 0;
    _maxReadSize = maxReadSize;
}

long MemorySource::read(data_t *buf, length_t length) {
    offset_t count = _length - _offset;
    if (count > length)
        count = length;
    if (_maxReadSize > 0 && count > _maxReadSize)
        count = _maxReadSize;
    if (count > 0) {
        memcpy(buf, _data + _offset, count);
        _offset += count;
    }
    return (long) count;
}
