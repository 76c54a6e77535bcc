// SPDX-License-Identifier: Apache-2.0

#include <errno.h>
#include <stdio.h> // printf()
#include <stdlib.h> // exit(), rand(), mkstemp()
#include <string.h> // memcmp()
#include <unistd.h> // write(), close(), unlink()
#include <vector>

#include <glog/logging.h>
#include <boost/timer/timer.hpp>

#include "../../common/config.hh"
#include "../../common/checksum_calculator.hh"
#include "../../common/define.hh"
#include "../../dedup/chunking/fastcdc.hh"
#include "../../dedup/stream/byte_source.hh"
#include "../../dedup/stream/stream_cdc.hh"

static const offset_t dataSize = (1 << 20) + 12345;
static const length_t minSize = 4096;
static const length_t avgSize = 16384;
static const length_t maxSize = 65535;

/**
 * Source that fails after providing a number of bytes
 **/
class FailingSource : public ByteSource {
public:
    FailingSource(const data_t *data, offset_t failAt) : _memory(data, failAt, 3000) {}

    long read(data_t *buf, length_t length) {
        long ret = _memory.read(buf, length);
        if (ret == 0) {
            errno = EIO;
            return -1;
        }
        return ret;
    }

    std::string getName() const {
        return "failing";
    }

private:
    MemorySource _memory;
};

/**
 * Chunker that cuts beyond the bytes passed to it
 **/
class OverreachingChunker : public DedupChunker {
public:
    bool cut(const data_t *data, length_t length, Chunk &chunk) {
        chunk.set(0, 0, (offset_t) length + 1, length);
        return true;
    }

    void setContentLength(offset_t length) {}

    length_t getMinSize() const { return 256; }
    length_t getAvgSize() const { return 512; }
    length_t getMaxSize() const { return 1024; }
};

struct ReferenceChunk {
    uint64_t hash;
    offset_t offset;
    offset_t length;
    const char *md5;
};

static void exitWithError();
static void checkStream(StreamCDC &stream, const std::vector<data_t> &data, const std::vector<Chunk> &expected, const char *name);
static std::vector<Chunk> bulkChunks(const std::vector<data_t> &data);
static void checkReferenceFile(const char *path);

int main(int argc, char **argv) {

    /**
     * Tests for the synchronous stream chunker
     *
     * 1. Streaming and bulk equivalence
     * 2. Short reads
     * 3. Empty and short streams
     * 4. Source failure
     * 5. Drain overflow
     * 6. File source
     * 7. Reference file (when a path is given)
     *
     **/

    FLAGS_logtostderr = true;
    FLAGS_minloglevel = Config::getInstance().getLogLevel();
    google::InitGoogleLogging(argv[0]);

    // seed the random number sequence
    srand(4096);

    printf("Start Stream CDC Test\n");
    printf("====================\n");

    int testCount = 0;
    boost::timer::cpu_timer mytimer;

    std::vector<data_t> data(dataSize);
    for (offset_t i = 0; i < dataSize; i++) {
        data[i] = rand() & 0xff;
    }
    std::vector<Chunk> expected = bulkChunks(data);

    // 1. streaming and bulk equivalence
    {
        MemorySource source(data.data(), dataSize);
        StreamCDC stream(source, minSize, avgSize, maxSize);
        checkStream(stream, data, expected, "whole reads");
    }
    printf("> Test %d completes: Streaming and bulk equivalence over %lu chunks in %.3lf seconds\n", ++testCount, expected.size(), mytimer.elapsed().wall / 1e9);

    // 2. short reads
    {
        MemorySource shortSource(data.data(), dataSize, 4093);
        StreamCDC shortStream(shortSource, minSize, avgSize, maxSize);
        checkStream(shortStream, data, expected, "short reads");

        MemorySource source(data.data(), dataSize);
        StreamCDC limitedStream(source, minSize, avgSize, maxSize);
        limitedStream.setReadSize(777);
        checkStream(limitedStream, data, expected, "limited read size");
    }
    printf("> Test %d completes: Short reads\n", ++testCount);

    // 3. empty and short streams
    {
        ByteBuffer chunkData;
        Chunk chunk;

        MemorySource emptySource(data.data(), 0);
        StreamCDC emptyStream(emptySource, minSize, avgSize, maxSize);
        if (emptyStream.nextChunk(chunkData, chunk) || emptyStream.nextChunk(chunkData, chunk)) {
            printf(">> Found a chunk in an empty stream\n");
            exitWithError();
        }

        MemorySource shortSource(data.data(), 100);
        StreamCDC shortStream(shortSource, minSize, avgSize, maxSize);
        if (!shortStream.nextChunk(chunkData, chunk) || chunk.offset != 0 || chunk.cutpoint != 100 || chunkData.length() != 100 || memcmp(chunkData.data(), data.data(), 100) != 0) {
            printf(">> Unexpected chunk of a 100-byte stream: %s\n", chunk.print().c_str());
            exitWithError();
        }
        if (shortStream.nextChunk(chunkData, chunk) || !shortStream.isEndOfSource() || shortStream.getProcessed() != 100) {
            printf(">> Unexpected state at the end of a 100-byte stream\n");
            exitWithError();
        }
    }
    printf("> Test %d completes: Empty and short streams\n", ++testCount);

    // 4. source failure
    {
        const offset_t failAt = 200000;
        FailingSource source(data.data(), failAt);
        StreamCDC stream(source, minSize, avgSize, maxSize);
        ByteBuffer chunkData;
        Chunk chunk;
        size_t numChunks = 0;
        bool failed = false;
        try {
            while (stream.nextChunk(chunkData, chunk)) {
                if (chunk != expected.at(numChunks) || memcmp(chunkData.data(), data.data() + chunk.offset, chunkData.length()) != 0) {
                    printf(">> Chunk %lu before the failure mismatched: %s\n", numChunks, chunk.print().c_str());
                    exitWithError();
                }
                numChunks++;
            }
        } catch (StreamIOError &e) {
            failed = e.getErrno() == EIO;
        }
        if (!failed) {
            printf(">> Source failure is not reported\n");
            exitWithError();
        }
        if (chunk.cutpoint > failAt) {
            printf(">> Chunk ends beyond the failure at %lu\n", (unsigned long) failAt);
            exitWithError();
        }
        // the sequence ends at the failure
        failed = false;
        try {
            stream.nextChunk(chunkData, chunk);
        } catch (StreamIOError &e) {
            failed = true;
        }
        if (!failed) {
            printf(">> Stream continues after a source failure\n");
            exitWithError();
        }
    }
    printf("> Test %d completes: Source failure\n", ++testCount);

    // 5. drain overflow
    {
        MemorySource source(data.data(), dataSize);
        StreamCDC stream(source, new OverreachingChunker());
        ByteBuffer chunkData;
        Chunk chunk;
        bool failed = false;
        try {
            stream.nextChunk(chunkData, chunk);
        } catch (StreamBufferError &e) {
            failed = true;
        }
        if (!failed) {
            printf(">> Drain overflow is not reported\n");
            exitWithError();
        }
    }
    printf("> Test %d completes: Drain overflow\n", ++testCount);

    // 6. file source
    {
        char path[] = "/tmp/stream_cdc_test_XXXXXX";
        int fd = mkstemp(path);
        if (fd == -1) {
            printf(">> Failed to create a temporary file, %s\n", strerror(errno));
            exitWithError();
        }
        offset_t written = 0;
        while (written < dataSize) {
            ssize_t ret = write(fd, data.data() + written, dataSize - written);
            if (ret <= 0) {
                printf(">> Failed to write the temporary file, %s\n", strerror(errno));
                close(fd);
                unlink(path);
                exitWithError();
            }
            written += ret;
        }
        close(fd);

        {
            FileSource source(path);
            StreamCDC stream(source, minSize, avgSize, maxSize);
            checkStream(stream, data, expected, "file");
        }
        unlink(path);

        bool failed = false;
        try {
            FileSource missing(path);
        } catch (StreamIOError &e) {
            failed = e.getErrno() == ENOENT;
        }
        if (!failed) {
            printf(">> Opening a missing file is not reported\n");
            exitWithError();
        }
    }
    printf("> Test %d completes: File source\n", ++testCount);

    // 7. reference file
    if (argc > 1) {
        checkReferenceFile(argv[1]);
        printf("> Test %d completes: Reference file %s\n", ++testCount, argv[1]);
    } else {
        printf("> Test %d skipped: No reference file given\n", ++testCount);
    }

    printf("End of Stream CDC Test. All passed!\n");
    printf("====================\n");

    return 0;
}

static void exitWithError() {
    printf("Test Failed!!!\n");
    exit(1);
}

static std::vector<Chunk> bulkChunks(const std::vector<data_t> &data) {
    std::vector<Chunk> chunks;
    FastCDC cdc(minSize, avgSize, maxSize);
    cdc.setContentLength(data.size());
    FastCDC::Iterator it = cdc.iterate(data.data(), data.size());
    Chunk chunk;
    while (it.next(chunk)) {
        // absolute positions, as reported by the stream
        chunk.cutpointInBuffer = chunk.getLength();
        chunks.push_back(chunk);
    }
    return chunks;
}

static void checkStream(StreamCDC &stream, const std::vector<data_t> &data, const std::vector<Chunk> &expected, const char *name) {
    ByteBuffer chunkData;
    Chunk chunk;
    size_t numChunks = 0;
    SHA256Calculator streamDigest;

    while (stream.nextChunk(chunkData, chunk)) {
        if (numChunks >= expected.size() || chunk != expected.at(numChunks)) {
            printf(">> [%s] Chunk %lu mismatched: %s\n", name, numChunks, chunk.print().c_str());
            exitWithError();
        }
        if (chunkData.length() != chunk.getLength()) {
            printf(">> [%s] Chunk %lu has %u bytes instead of %lu\n", name, numChunks, chunkData.length(), (unsigned long) chunk.getLength());
            exitWithError();
        }
        std::string md5 = MD5Calculator::digest(chunkData.data(), chunkData.length());
        std::string expectedMd5 = MD5Calculator::digest(data.data() + chunk.offset, chunk.getLength());
        if (md5.empty() || md5 != expectedMd5) {
            printf(">> [%s] Chunk %lu digest mismatched (%s vs %s)\n", name, numChunks, md5.c_str(), expectedMd5.c_str());
            exitWithError();
        }
        streamDigest.append(chunkData.data(), chunkData.length());
        numChunks++;
    }

    if (numChunks != expected.size() || stream.getProcessed() != data.size()) {
        printf(">> [%s] Stream ends after %lu chunks and %lu bytes\n", name, numChunks, (unsigned long) stream.getProcessed());
        exitWithError();
    }

    SHA256Calculator dataDigest;
    dataDigest.append(data.data(), data.size());
    if (streamDigest.finalizeInHex() != dataDigest.finalizeInHex()) {
        printf(">> [%s] Digest of the reconstructed stream mismatched\n", name);
        exitWithError();
    }
}

static void checkReferenceFile(const char *path) {
    const ReferenceChunk reference[] = {
        { 17968276318003433923ULL, 0, 21325, "2bb52734718194617c957f5e07ee6054" },
        { 8197189939299398838ULL, 21325, 17140, "badfb0757fe081c20336902e7131f768" },
        { 13019990849178155730ULL, 38465, 28084, "18412d7414de6eb42f638351711f729d" },
        { 4509236223063678303ULL, 66549, 18217, "04fe1405fc5f960363bfcd834c056407" },
        { 2504464741100432583ULL, 84766, 24700, "1aa7ad95f274d6ba34a983946ebc5af3" },
    };
    const size_t numReference = sizeof(reference) / sizeof(ReferenceChunk);

    try {
        FileSource source(path);
        StreamCDC stream(source, 4096, 16384, 65535);
        ByteBuffer chunkData;
        Chunk chunk;
        size_t numChunks = 0;
        while (stream.nextChunk(chunkData, chunk)) {
            if (numChunks >= numReference) {
                printf(">> Extra chunk in the reference file: %s\n", chunk.print().c_str());
                exitWithError();
            }
            const ReferenceChunk &ref = reference[numChunks];
            std::string md5 = MD5Calculator::digest(chunkData.data(), chunkData.length());
            if (chunk.hash != ref.hash || (offset_t) chunk.offset != ref.offset || chunk.getLength() != ref.length || md5 != ref.md5) {
                printf(">> Reference chunk %lu mismatched: %s md5 = %s\n", numChunks, chunk.print().c_str(), md5.c_str());
                exitWithError();
            }
            numChunks++;
        }
        if (numChunks != numReference) {
            printf(">> Found %lu instead of %lu chunks in the reference file\n", numChunks, numReference);
            exitWithError();
        }
    } catch (StreamIOError &e) {
        printf(">> Failed to read the reference file, %s\n", e.what());
        exitWithError();
    }
}
