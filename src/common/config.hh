// SPDX-License-Identifier: Apache-2.0

#ifndef __CONFIG_HH__
#define __CONFIG_HH__

#include <stdint.h>
#include <limits.h>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include "define.hh"

class Config {
public:

    static Config& getInstance() {
        static Config instance; // Guaranteed to be destroyed
        // Instantiated on first use
        return instance;
    }

    /**
     * Load the configuration file
     *
     * @param[in] path                     path to the configuration file
     *
     * @exception boost::property_tree::ini_parser_error if the file cannot be read
     **/
    void setConfigPath (const char *path = "fastcdc.ini");
    void setConfigPath (std::string path);

    // log
    bool glogToConsole() const;
    std::string getGlogDir() const;
    int getLogLevel() const;

    // chunking
    length_t getMinChunkSize() const;
    length_t getAvgChunkSize() const;
    length_t getMaxChunkSize() const;
    NormalizationLevel getNormalizationLevel() const;
    uint64_t getGearSeed() const;

    // stream
    length_t getReadSize() const;

    void printConfig() const;

private:
    Config();
    Config(Config const&); // Don't Implement
    void operator=(Config const&); // Don't implement

    bool readBoolWithDefault (const boost::property_tree::ptree &pt, const char *key, bool dv) const;
    unsigned long long readULLWithDefault (const boost::property_tree::ptree &pt, const char *key, unsigned long long dv) const;
    unsigned long long readULLWithBoundsAndDefault (const boost::property_tree::ptree &pt, const char *key, unsigned long long dv, unsigned long long min, unsigned long long max) const;
    std::string readStringWithDefault (const boost::property_tree::ptree &pt, const char *key, std::string dv) const;

    int parseLogLevel(std::string levelName) const;
    NormalizationLevel parseNormalizationLevel(std::string levelName) const;

    static const char *LogLevelName[];

    boost::property_tree::ptree _pt;

    struct {
        int level;
        bool glogToConsole;
        std::string glogdir;
    } _log;

    struct {
        length_t minSize;
        length_t avgSize;
        length_t maxSize;
        NormalizationLevel level;
        uint64_t seed;
    } _chunking;

    struct {
        length_t readSize;
    } _stream;
};

#endif // define __CONFIG_HH__
