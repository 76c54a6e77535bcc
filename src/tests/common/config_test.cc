// SPDX-License-Identifier: Apache-2.0

#include <stdio.h> // printf(), fopen()
#include <stdlib.h> // exit(), mkstemp()
#include <unistd.h> // close(), unlink()
#include <string>

#include <glog/logging.h>
#include <boost/property_tree/ini_parser.hpp>

#include "../../common/config.hh"
#include "../../common/define.hh"
#include "../../dedup/chunking/chunker_generator.hh"

static std::string configPath;

static void exitWithError();
static void writeConfig(const char *content);

int main(int argc, char **argv) {

    /**
     * Tests for the configuration
     *
     * 1. Full configuration
     * 2. Defaults of missing keys
     * 3. Invalid values
     * 4. Invalid chunking settings
     * 5. Missing configuration file
     *
     **/

    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_ERROR;
    google::InitGoogleLogging(argv[0]);

    char path[] = "/tmp/config_test_XXXXXX";
    int fd = mkstemp(path);
    if (fd == -1) {
        printf(">> Failed to create a temporary config file\n");
        exit(1);
    }
    close(fd);
    configPath = path;

    printf("Start Config Test\n");
    printf("====================\n");

    int testCount = 0;
    Config &config = Config::getInstance();

    // 1. full configuration
    writeConfig(
        "[log]\n"
        "glog_to_console = true\n"
        "level = WARNING\n"
        "[chunking]\n"
        "min_size = 2048\n"
        "avg_size = 8192\n"
        "max_size = 32768\n"
        "normalization = Level2\n"
        "seed = 0x1234abcd\n"
        "[stream]\n"
        "read_size = 4096\n"
    );
    config.setConfigPath(configPath);
    if (!config.glogToConsole() || config.getLogLevel() != google::GLOG_WARNING) {
        printf(">> Unexpected log settings (console = %d, level = %d)\n", config.glogToConsole(), config.getLogLevel());
        exitWithError();
    }
    if (config.getMinChunkSize() != 2048 || config.getAvgChunkSize() != 8192 || config.getMaxChunkSize() != 32768) {
        printf(">> Unexpected chunk sizes (%u, %u, %u)\n", config.getMinChunkSize(), config.getAvgChunkSize(), config.getMaxChunkSize());
        exitWithError();
    }
    if (config.getNormalizationLevel() != NORMALIZATION_LEVEL_2 || config.getGearSeed() != 0x1234abcdULL || config.getReadSize() != 4096) {
        printf(">> Unexpected chunking settings (level = %d, seed = %lx, read size = %u)\n", config.getNormalizationLevel(), (unsigned long) config.getGearSeed(), config.getReadSize());
        exitWithError();
    }
    {
        FastCDC *cdc = ChunkerGenerator::genChunker(config);
        if (cdc == 0 || cdc->getMinSize() != 2048 || cdc->getNormalizationLevel() != NORMALIZATION_LEVEL_2 || cdc->getSeed() != 0x1234abcdULL) {
            printf(">> Failed to generate a chunker from the config\n");
            delete cdc;
            exitWithError();
        }
        delete cdc;
    }
    printf("> Test %d completes: Full configuration\n", ++testCount);

    // 2. defaults of missing keys
    writeConfig(
        "[chunking]\n"
        "avg_size = 65536\n"
        "normalization = none\n"
    );
    config.setConfigPath(configPath);
    if (config.getMinChunkSize() != 16384 || config.getAvgChunkSize() != 65536 || config.getMaxChunkSize() != 262144) {
        printf(">> Unexpected default sizes (%u, %u, %u)\n", config.getMinChunkSize(), config.getAvgChunkSize(), config.getMaxChunkSize());
        exitWithError();
    }
    if (config.getNormalizationLevel() != NORMALIZATION_LEVEL_0 || config.getGearSeed() != 0 || config.getReadSize() != 0) {
        printf(">> Unexpected default chunking settings\n");
        exitWithError();
    }
    if (!config.glogToConsole() || config.getLogLevel() != google::GLOG_ERROR) {
        printf(">> Unexpected default log settings\n");
        exitWithError();
    }
    writeConfig("");
    config.setConfigPath(configPath);
    if (config.getAvgChunkSize() != DEFAULT_AVERAGE_SIZE || config.getNormalizationLevel() != DEFAULT_NORMALIZATION_LEVEL) {
        printf(">> Unexpected settings of an empty config\n");
        exitWithError();
    }
    printf("> Test %d completes: Defaults of missing keys\n", ++testCount);

    // 3. invalid values
    writeConfig(
        "[log]\n"
        "level = verbose\n"
        "[chunking]\n"
        "avg_size = large\n"
        "normalization = 2\n"
        "[stream]\n"
        "read_size = 9999999999\n"
    );
    config.setConfigPath(configPath);
    if (config.getLogLevel() != google::GLOG_ERROR || config.getAvgChunkSize() != DEFAULT_AVERAGE_SIZE) {
        printf(">> Invalid values are not replaced by defaults\n");
        exitWithError();
    }
    if (config.getNormalizationLevel() != NORMALIZATION_LEVEL_2 || config.getReadSize() != FASTCDC_MAXIMUM_MAX) {
        printf(">> Unexpected level or read size (%d, %u)\n", config.getNormalizationLevel(), config.getReadSize());
        exitWithError();
    }
    printf("> Test %d completes: Invalid values\n", ++testCount);

    // 4. invalid chunking settings
    writeConfig(
        "[chunking]\n"
        "normalization = Level7\n"
    );
    config.setConfigPath(configPath);
    if (config.getNormalizationLevel() != UNKNOWN_NORMALIZATION_LEVEL || ChunkerGenerator::genChunker(config) != 0) {
        printf(">> Unknown normalization level is accepted\n");
        exitWithError();
    }
    writeConfig(
        "[chunking]\n"
        "min_size = 8192\n"
        "avg_size = 4096\n"
        "max_size = 16384\n"
    );
    config.setConfigPath(configPath);
    if (ChunkerGenerator::genChunker(config) != 0) {
        printf(">> Minimum size above the average size is accepted\n");
        exitWithError();
    }
    printf("> Test %d completes: Invalid chunking settings\n", ++testCount);

    // 5. missing configuration file
    unlink(configPath.c_str());
    {
        bool failed = false;
        try {
            config.setConfigPath(configPath);
        } catch (boost::property_tree::ini_parser_error &e) {
            failed = true;
        }
        if (!failed) {
            printf(">> Missing config file is not reported\n");
            exitWithError();
        }
    }
    printf("> Test %d completes: Missing configuration file\n", ++testCount);

    printf("End of Config Test. All passed!\n");
    printf("====================\n");

    return 0;
}

static void exitWithError() {
    unlink(configPath.c_str());
    printf("Test Failed!!!\n");
    exit(1);
}

static void writeConfig(const char *content) {
    FILE *f = fopen(configPath.c_str(), "w");
    if (f == NULL) {
        printf(">> Failed to open %s for write\n", configPath.c_str());
        exitWithError();
    }
    fputs(content, f);
    fclose(f);
}
