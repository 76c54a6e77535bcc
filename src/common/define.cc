// SPDX-License-Identifier: Apache-2.0

#include "define.hh"

const char *NormalizationLevelName[] = {
    "Level0",
    "Level1",
    "Level2",
    "Level3",

    "Unknown"
};
