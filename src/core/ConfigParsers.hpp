/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace ks {

class ConfigParsers {
public:
    static void parseGeneral(const toml::table& tbl, bool& debug);
    static void parseSync(const toml::table& tbl, SyncConfig& cfg);
    static void parseTimeline(const toml::table& tbl, TimelineConfig& cfg);
    static void parseOutput(const toml::table& tbl, OutputConfig& cfg);

    static toml::table serialize(const SyncConfig& sync,
                                 const TimelineConfig& timeline,
                                 const OutputConfig& output,
                                 bool debug);
};

} // namespace ks
