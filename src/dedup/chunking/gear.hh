// SPDX-License-Identifier: Apache-2.0

#ifndef __GEAR_HH__
#define __GEAR_HH__

#include <stdint.h>

#include "../../common/define.hh"

/**
 * Gear table for the rolling hash, one 64-bit value per byte value
 **/
class Gear {
public:
    /**
     * Build the table from the default table
     *
     * @param[in] seed                     value XOR-ed into every entry, 0 keeps the default table
     **/
    Gear(uint64_t seed = 0);

    void reseed(uint64_t seed);

    inline uint64_t operator[](data_t byte) const {
        return _table[byte];
    }

    uint64_t getSeed() const {
        return _seed;
    }

    static const uint64_t DefaultTable[GEAR_TABLE_SIZE];

private:
    uint64_t _table[GEAR_TABLE_SIZE];
    uint64_t _seed;
};

#endif // define __GEAR_HH__
