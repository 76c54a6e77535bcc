// SPDX-License-Identifier: Apache-2.0

#include <string.h> // strerror()

#include "chunker_error.hh"

// see ChunkerConfigError::Type in dedup/chunking/chunker_error.hh
const char *ChunkerConfigError::TypeName[] = {
    "minimum size is below the lower bound",      // 0
    "minimum size is above the upper bound",
    "average size is below the lower bound",
    "average size is above the upper bound",
    "maximum size is below the lower bound",
    "maximum size is above the upper bound",      // 5
    "minimum size is above the average size",
    "average size is above the maximum size",
    "normalization level is unknown",

    "unknown configuration error"
};

ChunkerConfigError::ChunkerConfigError(Type type, unsigned long value, unsigned long bound) :
        std::invalid_argument(genMessage(type, value, bound)) {
    _type = type;
    _value = value;
    _bound = bound;
}

std::string ChunkerConfigError::genMessage(Type type, unsigned long value, unsigned long bound) {
    std::string msg;
    return msg
        .append(TypeName[type < UNKNOWN_CONFIG_ERROR ? type : UNKNOWN_CONFIG_ERROR])
        .append(" (value = ").append(std::to_string(value))
        .append(", bound = ").append(std::to_string(bound))
        .append(")")
    ;
}

StreamIOError::StreamIOError(const std::string &what, int err) :
        std::runtime_error(what + ": " + strerror(err)) {
    _errno = err;
}

StreamBufferError::StreamBufferError(length_t requested, length_t buffered) :
        std::logic_error(std::string("Drain of ")
            .append(std::to_string(requested))
            .append(" bytes exceeds the ")
            .append(std::to_string(buffered))
            .append(" buffered bytes")) {
}

namespace stream_errc {

class StreamErrorCategory : public boost::system::error_category {
public:
    const char *name() const BOOST_NOEXCEPT {
        return "fastcdc.stream";
    }

    std::string message(int ev) const {
        switch (ev) {
        case drain_overflow:
            return "drain requested for more bytes than buffered";
        default:
            return "unknown stream error";
        }
    }
};

const boost::system::error_category &getCategory() {
    static StreamErrorCategory instance;
    return instance;
}

}
