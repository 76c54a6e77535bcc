// SPDX-License-Identifier: Apache-2.0

#include <glog/logging.h>

#include "fastcdc.hh"

FastCDC::FastCDC(length_t minSize, length_t avgSize, length_t maxSize) {
    init(minSize, avgSize, maxSize, DEFAULT_NORMALIZATION_LEVEL, 0);
}

FastCDC::FastCDC(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level, uint64_t seed) {
    init(minSize, avgSize, maxSize, level, seed);
}

FastCDC::~FastCDC() {
}

void FastCDC::validate(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level) {
    // absolute bounds
    if (minSize < FASTCDC_MINIMUM_MIN)
        throw ChunkerConfigError(ChunkerConfigError::MINIMUM_TOO_LOW, minSize, FASTCDC_MINIMUM_MIN);
    if (minSize > FASTCDC_MINIMUM_MAX)
        throw ChunkerConfigError(ChunkerConfigError::MINIMUM_TOO_HIGH, minSize, FASTCDC_MINIMUM_MAX);
    if (avgSize < FASTCDC_AVERAGE_MIN)
        throw ChunkerConfigError(ChunkerConfigError::AVERAGE_TOO_LOW, avgSize, FASTCDC_AVERAGE_MIN);
    if (avgSize > FASTCDC_AVERAGE_MAX)
        throw ChunkerConfigError(ChunkerConfigError::AVERAGE_TOO_HIGH, avgSize, FASTCDC_AVERAGE_MAX);
    if (maxSize < FASTCDC_MAXIMUM_MIN)
        throw ChunkerConfigError(ChunkerConfigError::MAXIMUM_TOO_LOW, maxSize, FASTCDC_MAXIMUM_MIN);
    if (maxSize > FASTCDC_MAXIMUM_MAX)
        throw ChunkerConfigError(ChunkerConfigError::MAXIMUM_TOO_HIGH, maxSize, FASTCDC_MAXIMUM_MAX);
    // relations
    if (minSize > avgSize)
        throw ChunkerConfigError(ChunkerConfigError::MINIMUM_ABOVE_AVERAGE, minSize, avgSize);
    if (avgSize > maxSize)
        throw ChunkerConfigError(ChunkerConfigError::AVERAGE_ABOVE_MAXIMUM, avgSize, maxSize);
    // normalization
    if (level < NORMALIZATION_LEVEL_0 || level >= UNKNOWN_NORMALIZATION_LEVEL)
        throw ChunkerConfigError(ChunkerConfigError::UNKNOWN_NORMALIZATION, (unsigned long) level, NORMALIZATION_LEVEL_3);
}

void FastCDC::init(length_t minSize, length_t avgSize, length_t maxSize, NormalizationLevel level, uint64_t seed) {
    validate(minSize, avgSize, maxSize, level);

    _minSize = minSize;
    _avgSize = avgSize;
    _maxSize = maxSize;
    _level = level;
    _masks = Normalization::getMasks(avgSize, level);
    _gear.reseed(seed);

    _state.hash = 0;
    _state.chunkLength = 0;
    _state.position = 0;
    _state.contentLength = INVALID_CONTENT_LENGTH;

    DLOG(INFO) << "FastCDC init with min=" << minSize << ",avg=" << avgSize << ",max=" << maxSize
               << ",level=" << NormalizationLevelName[level] << ",seed=" << seed
               << std::hex << ",maskS=0x" << _masks.maskSmall << ",maskL=0x" << _masks.maskLarge;
}

void FastCDC::setContentLength(offset_t length) {
    if (length < _state.position) {
        LOG(WARNING) << "Content length " << length << " is below the " << _state.position << " bytes already scanned";
    }
    _state.contentLength = length;
}

offset_t FastCDC::getChunkLimit() const {
    offset_t limit = _maxSize;
    if (hasContentLength()) {
        offset_t chunkStart = _state.position - _state.chunkLength;
        offset_t left = _state.contentLength > chunkStart ? _state.contentLength - chunkStart : 0;
        if (left < limit)
            limit = left;
    }
    return limit;
}

bool FastCDC::cut(const data_t *data, length_t length, Chunk &chunk) {
    length_t carried = _state.chunkLength;
    length_t limit = (length_t) getChunkLimit();

    // the chunk reached the end of content in previous calls
    if (carried > 0 && carried >= limit) {
        emitChunk(_state.hash, 0, carried, chunk);
        return true;
    }
    // nothing left before the end of content
    if (limit == 0) {
        return false;
    }

    // bytes of the chunk are hashed in pairs from an even index, and the last byte
    // of an odd limit is never tested; the small mask applies before the split point
    length_t center = _avgSize < limit ? _avgSize : limit;
    length_t hashStart = (_minSize / 2) * 2;
    length_t hashEnd = (limit / 2) * 2;
    length_t smallEnd = (center / 2) * 2;
    if (limit <= _minSize) {
        hashStart = hashEnd = limit;
    }
    if (smallEnd > hashEnd) {
        smallEnd = hashEnd;
    }

    uint64_t hash = _state.hash;
    length_t pos = _state.chunkLength;   // index of the next byte in the chunk
    length_t i = 0;                      // index of the next byte in data

    // skip bytes before the minimum size
    if (pos < hashStart) {
        length_t skip = hashStart - pos;
        if (skip > length - i)
            skip = length - i;
        pos += skip;
        i += skip;
    }

    // small mask before the split point
    const uint64_t maskSmall = _masks.maskSmall;
    while (i < length && pos < smallEnd) {
        hash = (hash << 1) + _gear[data[i]];
        if ((hash & maskSmall) == 0 && pos >= _minSize) {
            _state.position += i;
            emitChunk((pos & 1) ? hash : hash << 1, i, carried, chunk);
            return true;
        }
        pos++;
        i++;
    }

    // large mask after the split point
    const uint64_t maskLarge = _masks.maskLarge;
    while (i < length && pos < hashEnd) {
        hash = (hash << 1) + _gear[data[i]];
        if ((hash & maskLarge) == 0 && pos >= _minSize) {
            _state.position += i;
            emitChunk((pos & 1) ? hash : hash << 1, i, carried, chunk);
            return true;
        }
        pos++;
        i++;
    }

    // bytes not tested before the limit
    if (pos < limit) {
        length_t rest = limit - pos;
        if (rest > length - i)
            rest = length - i;
        pos += rest;
        i += rest;
    }

    _state.position += i;

    // forced cut at the maximum size or the end of content
    if (pos >= limit) {
        emitChunk(hash, i, carried, chunk);
        return true;
    }

    // no cut point in this data, continue on the next call
    _state.hash = hash;
    _state.chunkLength = pos;
    return false;
}

void FastCDC::emitChunk(uint64_t hash, length_t consumed, length_t carried, Chunk &chunk) {
    // a chunk started in earlier calls ends at its full length from its start
    chunk.set(hash, carried > 0 ? -(soffset_t) carried : 0, (offset_t) carried + consumed, consumed);
    _state.hash = 0;
    _state.chunkLength = 0;
}

FastCDC::Iterator FastCDC::iterate(const data_t *data, length_t length) {
    return Iterator(this, data, length);
}

FastCDC::Iterator::Iterator(FastCDC *cdc, const data_t *data, length_t length) {
    _cdc = cdc;
    _data = data;
    _length = length;
    _cursor = 0;
    _done = false;
}

bool FastCDC::Iterator::next(Chunk &chunk) {
    if (_done)
        return false;

    Chunk found;
    if (!_cdc->cut(_data + _cursor, _length - _cursor, found)) {
        _done = true;
        return false;
    }

    // convert to positions in the buffer
    soffset_t start = (soffset_t) _cursor + found.offset;
    chunk.set(
        found.hash,
        start,
        start < 0 ? found.getLength() : (offset_t) ((soffset_t) _cursor + found.getEnd()),
        found.cutpointInBuffer
    );
    _cursor += found.cutpointInBuffer;
    return true;
}
