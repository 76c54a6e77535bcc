// SPDX-License-Identifier: Apache-2.0

#ifndef __ASYNC_BYTE_SOURCE_HH__
#define __ASYNC_BYTE_SOURCE_HH__

#include <string>

#include <boost/function.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/system/error_code.hpp>

#include "../../common/define.hh"

/**
 * Source of bytes that completes reads asynchronously
 **/
class AsyncByteSource {
public:
    /**
     * Completion of a read: error code and number of bytes read, 0 bytes without error at the end of source
     **/
    typedef boost::function<void (const boost::system::error_code &, std::size_t)> ReadHandler;

    AsyncByteSource() {};
    virtual ~AsyncByteSource() {};

    /**
     * Start reading bytes from the source
     *
     * @param[out] buf                     buffer to hold the bytes, must stay valid until completion
     * @param[in] length                   size of the buffer
     * @param[in] handler                  completion handler, must not be invoked before this function returns
     **/
    virtual void asyncRead(data_t *buf, length_t length, ReadHandler handler) = 0;

    /**
     * Cancel the pending reads
     *
     * Handlers of cancelled reads still run, usually with boost::asio::error::operation_aborted.
     **/
    virtual void cancel() = 0;

    virtual std::string getName() const = 0;
};

/**
 * Bytes of a pipe, socket or any other descriptor supported by Boost.Asio
 **/
class DescriptorSource : public AsyncByteSource {
public:
    /**
     * @param[in] io                       I/O context to run the reads
     * @param[in] fd                       readable descriptor, closed by the source upon destruction
     **/
    DescriptorSource(boost::asio::io_context &io, int fd);
    ~DescriptorSource();

    void asyncRead(data_t *buf, length_t length, ReadHandler handler);
    void cancel();

    std::string getName() const {
        return _name;
    }

private:
    boost::asio::posix::stream_descriptor _descriptor;

    // report the end of source as a zero-byte read
    static void onRead(const boost::system::error_code &ec, std::size_t bytes, ReadHandler handler);

    std::string _name;
};

#endif // define __ASYNC_BYTE_SOURCE_HH__
