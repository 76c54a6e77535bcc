// SPDX-License-Identifier: Apache-2.0

#ifndef __CHUNK_HH__
#define __CHUNK_HH__

#include <string>
#include <nlohmann/json.hpp>
#include <glog/logging.h>

#include "../common/define.hh"

/**
 * A cut point reported by a chunker
 *
 * For a detector, offsets are relative to the data passed to the call that found
 * the cut point. A negative offset is the number of chunk bytes passed in earlier
 * calls, and the cut point is then measured from the start of the chunk, so it
 * equals the chunk length. For a stream chunker, offsets are absolute positions
 * in the stream.
 **/
struct Chunk {
    uint64_t hash;               /**< rolling hash at the cut point (boundary fingerprint) */
    soffset_t offset;            /**< start of the chunk */
    offset_t cutpoint;           /**< end of the chunk, from the chunk start if offset is negative */
    length_t cutpointInBuffer;   /**< number of bytes of the current data that belong to the chunk */

    Chunk() {
        reset();
    }

    Chunk(uint64_t hasht, soffset_t offsett, offset_t cutpointt, length_t cutpointInBuffert) {
        set(hasht, offsett, cutpointt, cutpointInBuffert);
    }

    void set(uint64_t hasht, soffset_t offsett, offset_t cutpointt, length_t cutpointInBuffert) {
        hash = hasht;
        offset = offsett;
        cutpoint = cutpointt;
        cutpointInBuffer = cutpointInBuffert;
    }

    void reset() {
        set(0, 0, 0, 0);
    }

    offset_t getLength() const {
        return offset < 0 ? cutpoint : (offset_t) ((soffset_t) cutpoint - offset);
    }

    // end of the chunk in the coordinates of offset
    soffset_t getEnd() const {
        return offset < 0 ? (soffset_t) cutpoint + offset : (soffset_t) cutpoint;
    }

    bool operator== (const Chunk &rhs) const {
        return hash == rhs.hash
            && offset == rhs.offset
            && cutpoint == rhs.cutpoint
            && cutpointInBuffer == rhs.cutpointInBuffer
        ;
    }

    bool operator!= (const Chunk &rhs) const {
        return !(*this == rhs);
    }

    std::string print() const {
        std::string output;
        return output
              .append("hash = ").append(std::to_string(hash)).append("; ")
              .append("offset = ").append(std::to_string(offset)).append("; ")
              .append("cutpoint = ").append(std::to_string(cutpoint)).append("; ")
              .append("length = ").append(std::to_string(getLength())).append("; ")
        ;
    }

    // serializer and deseralizer

    std::string toString() const {
        return toJson().dump();
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["hash"] = hash;
        j["offset"] = offset;
        j["cutpoint"] = cutpoint;
        j["cutpoint_in_buffer"] = cutpointInBuffer;
        j["length"] = getLength();
        return j;
    }

    bool fromString(const std::string &s) {
        try {
            return fromObject(nlohmann::json::parse(s));
        } catch (std::exception &e) {
            DLOG(INFO) << "Failed to parse chunk " << e.what();
            return false;
        }
    }

    bool fromObject(const nlohmann::json &j) {
        try {
            hash = j.at("hash").get<uint64_t>();
            offset = j.at("offset").get<soffset_t>();
            cutpoint = j.at("cutpoint").get<offset_t>();
            cutpointInBuffer = j.at("cutpoint_in_buffer").get<length_t>();
        } catch (std::exception &e) {
            DLOG(INFO) << "Failed to parse chunk " << e.what();
            return false;
        }
        return true;
    }
};

#endif // define __CHUNK_HH__
