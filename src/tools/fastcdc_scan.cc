// SPDX-License-Identifier: Apache-2.0

#include <errno.h>
#include <stdio.h> // printf()
#include <stdlib.h> // getenv(), strtoull()
#include <unistd.h> // getopt()

#include <glog/logging.h>
#include <boost/timer/timer.hpp>

#include "../common/checksum_calculator.hh"
#include "../common/config.hh"
#include "../dedup/chunking/chunker_generator.hh"
#include "../dedup/stream/byte_source.hh"
#include "../dedup/stream/stream_cdc.hh"

void usage(const char *name) {
    fprintf(stderr,
        "Usage: %s [-s average size] [-j] <file> [config file]\n"
        "  -s  average chunk size, overrides the config (minimum = average / 4, maximum = average * 4)\n"
        "  -j  print chunks in JSON\n"
        "The config file may also be set through the environment variable FASTCDC_CONFIG_PATH\n"
        , name
    );
}

/**
 * Parse the average chunk size of the command line
 *
 * @param[in] value                    decimal number of bytes
 * @param[out] size                    the average chunk size
 *
 * @return whether the value is a number no larger than the maximum average size
 **/
bool parseAverageSize(const char *value, length_t &size) {
    char *end = NULL;
    errno = 0;
    unsigned long long v = strtoull(value, &end, 10);
    if (value[0] == '-' || end == value || *end != '\0' || errno == ERANGE || v == 0 || v > FASTCDC_AVERAGE_MAX) {
        return false;
    }
    size = (length_t) v;
    return true;
}

int main(int argc, char **argv) {
    length_t avgSize = 0;
    bool json = false;

    int opt = 0;
    while ((opt = getopt(argc, argv, "s:jh")) != -1) {
        switch (opt) {
        case 's':
            if (!parseAverageSize(optarg, avgSize)) {
                fprintf(stderr, "Invalid average chunk size %s, expected 1 to %u bytes\n", optarg, FASTCDC_AVERAGE_MAX);
                return 1;
            }
            break;
        case 'j':
            json = true;
            break;
        default:
            usage(argv[0]);
            return opt == 'h' ? 0 : 1;
        }
    }
    if (optind >= argc) {
        usage(argv[0]);
        return 1;
    }
    const char *filename = argv[optind];

    // system env path
    const char *envPath = std::getenv("FASTCDC_CONFIG_PATH");

    Config &config = Config::getInstance();
    try {
        if (optind + 1 < argc) {
            config.setConfigPath(std::string(argv[optind + 1]));
        } else if (envPath != 0) {
            config.setConfigPath(std::string(envPath));
        }
    } catch (std::exception &e) {
        fprintf(stderr, "Failed to load config file, %s\n", e.what());
        return 1;
    }

    // setup logging
    if (!config.glogToConsole()) {
        FLAGS_log_dir = config.getGlogDir().c_str();
    } else {
        FLAGS_logtostderr = true;
    }
    FLAGS_minloglevel = config.getLogLevel();
    google::InitGoogleLogging(argv[0]);

    boost::timer::cpu_timer mytimer;

    unsigned long numChunks = 0;
    try {
        FileSource source(filename);

        FastCDC *chunker = 0;
        if (avgSize > 0) {
            chunker = ChunkerGenerator::genChunker(avgSize / 4, avgSize, avgSize * 4, config.getNormalizationLevel(), config.getGearSeed());
        } else {
            chunker = ChunkerGenerator::genChunker(config);
        }
        if (chunker == 0) {
            fprintf(stderr, "Invalid chunking parameters\n");
            return 1;
        }

        // the stream takes the ownership of the chunker
        StreamCDC stream(source, chunker);
        stream.setReadSize(config.getReadSize());

        ByteBuffer data;
        Chunk chunk;
        while (stream.nextChunk(data, chunk)) {
            std::string md5 = MD5Calculator::digest(data.data(), data.length());
            if (json) {
                nlohmann::json j = chunk.toJson();
                j["md5"] = md5;
                printf("%s\n", j.dump().c_str());
            } else {
                printf("hash=%lu offset=%ld size=%lu md5=%s\n"
                    , (unsigned long) chunk.hash
                    , (long) chunk.offset
                    , (unsigned long) chunk.getLength()
                    , md5.c_str()
                );
            }
            numChunks++;
        }
    } catch (std::exception &e) {
        fprintf(stderr, "Failed to chunk %s, %s\n", filename, e.what());
        return 1;
    }

    boost::timer::cpu_times duration = mytimer.elapsed();
    printf("Found %lu chunks in %.3lf ms\n", numChunks, duration.wall * 1.0 / 1e6);

    return 0;
}
