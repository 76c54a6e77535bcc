// SPDX-License-Identifier: Apache-2.0

#include <sys/stat.h> // mkdir()
#include <sys/types.h> // mkdir()
#include <stdio.h> // snprintf()
#include <stdlib.h> // strtoull()

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <glog/logging.h>

#include "config.hh"

const char *Config::LogLevelName[] = {
    "INFO",
    "WARNING",
    "ERROR",
    "FATAL",

    "Unknown"
};

Config::Config() {
    _log.level = google::GLOG_ERROR;
    _log.glogToConsole = true;
    _log.glogdir = "/tmp/fastcdc_log";

    _chunking.avgSize = DEFAULT_AVERAGE_SIZE;
    _chunking.minSize = DEFAULT_AVERAGE_SIZE / 4;
    _chunking.maxSize = DEFAULT_AVERAGE_SIZE * 4;
    _chunking.level = DEFAULT_NORMALIZATION_LEVEL;
    _chunking.seed = 0;

    _stream.readSize = 0;
}

void Config::setConfigPath (std::string path) {
    setConfigPath(path.c_str());
}

void Config::setConfigPath (const char *path) {
    // do not catch error here, since the config file is required once specified
    _pt.clear();
    boost::property_tree::ini_parser::read_ini(path, _pt);

    // logging
    _log.glogToConsole = readBoolWithDefault(_pt, "log.glog_to_console", true);
    if (_log.glogToConsole == false) {
        _log.glogdir = readStringWithDefault(_pt, "log.glog_dir", "");
        if (_log.glogdir.empty()) {
            _log.glogdir = std::string("/tmp/fastcdc_log");
        }
        // create the directory for glog first
        mkdir(_log.glogdir.c_str(), 0755);
    }
    _log.level = parseLogLevel(readStringWithDefault(_pt, "log.level", "ERROR"));
    if (_log.level < 0) { _log.level = google::GLOG_ERROR; }

    // chunking, sizes are checked by the chunker
    _chunking.avgSize = readULLWithBoundsAndDefault(_pt, "chunking.avg_size", DEFAULT_AVERAGE_SIZE, 0, UINT32_MAX);
    _chunking.minSize = readULLWithBoundsAndDefault(_pt, "chunking.min_size", _chunking.avgSize / 4, 0, UINT32_MAX);
    _chunking.maxSize = readULLWithBoundsAndDefault(_pt, "chunking.max_size", (unsigned long long) _chunking.avgSize * 4, 0, UINT32_MAX);
    _chunking.level = parseNormalizationLevel(readStringWithDefault(_pt, "chunking.normalization", NormalizationLevelName[DEFAULT_NORMALIZATION_LEVEL]));
    // seed may be in hex
    std::string seed = readStringWithDefault(_pt, "chunking.seed", "0");
    _chunking.seed = strtoull(seed.c_str(), NULL, 0);

    // stream
    _stream.readSize = readULLWithBoundsAndDefault(_pt, "stream.read_size", 0, 0, FASTCDC_MAXIMUM_MAX);

    printConfig();
}

// Log

int Config::getLogLevel() const {
    return _log.level;
}

bool Config::glogToConsole() const {
    return _log.glogToConsole;
}

std::string Config::getGlogDir() const {
    return _log.glogdir;
}

// Chunking

length_t Config::getMinChunkSize() const {
    return _chunking.minSize;
}

length_t Config::getAvgChunkSize() const {
    return _chunking.avgSize;
}

length_t Config::getMaxChunkSize() const {
    return _chunking.maxSize;
}

NormalizationLevel Config::getNormalizationLevel() const {
    return _chunking.level;
}

uint64_t Config::getGearSeed() const {
    return _chunking.seed;
}

// Stream

length_t Config::getReadSize() const {
    return _stream.readSize;
}

void Config::printConfig() const {
    const int bufSize = 4096;
    char buf[bufSize];

    snprintf(buf, bufSize,
        "\n------ Log ------\n"
        " Log level                   : %s\n"
        " Debug to console            : %s\n"
        " Debug log directory         : %s\n"
        "------ Chunking ------\n"
        " Minimum size                : %uB\n"
        " Average size                : %uB\n"
        " Maximum size                : %uB\n"
        " Normalization               : %s\n"
        " Gear seed                   : 0x%llx\n"
        "------ Stream ------\n"
        " Read size                   : %uB%s\n"
        , LogLevelName[getLogLevel()]
        , glogToConsole()? "true" : "false"
        , getGlogDir().c_str()
        , getMinChunkSize()
        , getAvgChunkSize()
        , getMaxChunkSize()
        , NormalizationLevelName[getNormalizationLevel()]
        , (unsigned long long) getGearSeed()
        , getReadSize()
        , getReadSize() == 0 ? " (fill buffer)" : ""
    );
    LOG(INFO) << buf;
}

bool Config::readBoolWithDefault (const boost::property_tree::ptree &pt, const char *key, bool dv) const {
    return pt.get<bool>(key, dv);
}

unsigned long long Config::readULLWithDefault (const boost::property_tree::ptree &pt, const char *key, unsigned long long dv) const {
    return pt.get<unsigned long long>(key, dv);
}

unsigned long long Config::readULLWithBoundsAndDefault (const boost::property_tree::ptree &pt, const char *key, unsigned long long dv, unsigned long long min, unsigned long long max) const {
    unsigned long long value = dv;
    try {
        value = readULLWithDefault(pt, key, dv);
    } catch (std::exception &e) {
        LOG(WARNING) << "Invalid value for " << key << ", use default value " << dv;
    }
    return value < min ? min : (value > max? max : value);
}

std::string Config::readStringWithDefault (const boost::property_tree::ptree &pt, const char *key, std::string dv) const {
    return boost::algorithm::trim_copy(pt.get<std::string>(key, dv));
}

int Config::parseLogLevel(std::string levelName) const {
    for (int i = 0; i < google::NUM_SEVERITIES; i++) {
        if (boost::algorithm::to_lower_copy(std::string(LogLevelName[i])) == boost::algorithm::to_lower_copy(levelName))
            return i;
    }
    return -1;
}

NormalizationLevel Config::parseNormalizationLevel(std::string levelName) const {
    std::string name = boost::algorithm::to_lower_copy(levelName);
    if (name == "none")
        return NORMALIZATION_LEVEL_0;
    for (int i = 0; i < UNKNOWN_NORMALIZATION_LEVEL; i++) {
        if (boost::algorithm::to_lower_copy(std::string(NormalizationLevelName[i])) == name)
            return (NormalizationLevel) i;
    }
    // accept the plain level number as well
    if (name.size() == 1 && name[0] >= '0' && name[0] < '0' + UNKNOWN_NORMALIZATION_LEVEL)
        return (NormalizationLevel) (name[0] - '0');
    return UNKNOWN_NORMALIZATION_LEVEL;
}
