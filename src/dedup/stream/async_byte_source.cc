// SPDX-License-Identifier: Apache-2.0

#include <boost/bind/bind.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/placeholders.hpp>
#include <boost/asio/error.hpp>
#include <glog/logging.h>

#include "async_byte_source.hh"

DescriptorSource::DescriptorSource(boost::asio::io_context &io, int fd) :
        _descriptor(io, fd) {
    _name = std::string("fd:").append(std::to_string(fd));
}

DescriptorSource::~DescriptorSource() {
    boost::system::error_code ec;
    _descriptor.close(ec);
    if (ec) {
        LOG(WARNING) << "Failed to close " << _name << ", " << ec.message();
    }
}

void DescriptorSource::asyncRead(data_t *buf, length_t length, ReadHandler handler) {
    _descriptor.async_read_some(
        boost::asio::buffer(buf, length),
        boost::bind(
            &DescriptorSource::onRead,
            boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred,
            handler
        )
    );
}

void DescriptorSource::cancel() {
    boost::system::error_code ec;
    _descriptor.cancel(ec);
    if (ec) {
        LOG(WARNING) << "Failed to cancel reads on " << _name << ", " << ec.message();
    }
}

void DescriptorSource::onRead(const boost::system::error_code &ec, std::size_t bytes, ReadHandler handler) {
    if (ec == boost::asio::error::eof) {
        handler(boost::system::error_code(), 0);
    } else {
        handler(ec, bytes);
    }
}
