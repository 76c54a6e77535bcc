// SPDX-License-Identifier: Apache-2.0

#ifndef __CHUNKER_ERROR_HH__
#define __CHUNKER_ERROR_HH__

#include <stdexcept>
#include <string>
#include <boost/system/error_code.hpp>

#include "../../common/define.hh"

/**
 * Invalid chunker parameters, raised upon construction
 **/
class ChunkerConfigError : public std::invalid_argument {
public:
    // see also ChunkerConfigError::TypeName in dedup/chunking/chunker_error.cc
    enum Type {
        MINIMUM_TOO_LOW,          // 0
        MINIMUM_TOO_HIGH,
        AVERAGE_TOO_LOW,
        AVERAGE_TOO_HIGH,
        MAXIMUM_TOO_LOW,
        MAXIMUM_TOO_HIGH,         // 5
        MINIMUM_ABOVE_AVERAGE,
        AVERAGE_ABOVE_MAXIMUM,
        UNKNOWN_NORMALIZATION,

        UNKNOWN_CONFIG_ERROR
    };

    /**
     * @param[in] type                     the violated bound
     * @param[in] value                    the offending value
     * @param[in] bound                    the bound crossed by the value
     **/
    ChunkerConfigError(Type type, unsigned long value, unsigned long bound);

    Type getType() const {
        return _type;
    }

    unsigned long getValue() const {
        return _value;
    }

    unsigned long getBound() const {
        return _bound;
    }

    static const char *TypeName[];

private:
    Type _type;
    unsigned long _value;
    unsigned long _bound;

    static std::string genMessage(Type type, unsigned long value, unsigned long bound);
};

/**
 * Failure of the byte source of a stream chunker
 **/
class StreamIOError : public std::runtime_error {
public:
    StreamIOError(const std::string &what, int err);

    int getErrno() const {
        return _errno;
    }

private:
    int _errno;
};

/**
 * Inconsistent buffer state in a stream chunker
 **/
class StreamBufferError : public std::logic_error {
public:
    StreamBufferError(length_t requested, length_t buffered);
};

/**
 * Error codes reported by the asynchronous stream chunker
 **/
namespace stream_errc {
    enum StreamErrc {
        drain_overflow = 1        /**< requested to drain more bytes than buffered */
    };

    const boost::system::error_category &getCategory();

    inline boost::system::error_code make_error_code(StreamErrc e) {
        return boost::system::error_code(static_cast<int>(e), getCategory());
    }
}

namespace boost {
namespace system {
    template<> struct is_error_code_enum<stream_errc::StreamErrc> {
        static const bool value = true;
    };
}
}

#endif // define __CHUNKER_ERROR_HH__
