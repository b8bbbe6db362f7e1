#include "ConfigParsers.hpp"
#include <algorithm>
#include "Logger.hpp"

namespace ks {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_floating_point_v<T>) {
            // value<double>() also converts integer nodes ("min_line_duration = 2")
            if (auto val = node.value<double>())
                return static_cast<T>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(*val);
        }
    }
    return defaultVal;
}

Seconds nonNegative(Seconds v, std::string_view key) {
    if (v < 0.0) {
        LOG_WARN("Config: '{}' must not be negative ({}), using 0", key, v);
        return 0.0;
    }
    return v;
}
} // namespace

void ConfigParsers::parseGeneral(const toml::table& tbl, bool& debug) {
    if (auto gen = tbl["general"].as_table()) {
        debug = get(*gen, "debug", false);
    }
}

void ConfigParsers::parseSync(const toml::table& tbl, SyncConfig& cfg) {
    if (auto sync = tbl["sync"].as_table()) {
        cfg.minLineDuration = nonNegative(
                get(*sync, "min_line_duration", 1.2), "min_line_duration");
        cfg.globalOffsetThreshold =
                nonNegative(get(*sync, "global_offset_threshold", 2.0),
                            "global_offset_threshold");
        cfg.windowMargin = nonNegative(get(*sync, "window_margin", 1.0),
                                       "window_margin");
        cfg.minTokenLength = static_cast<u32>(std::clamp<i64>(
                get(*sync, "min_token_length", i64{3}), 1, 64));
        cfg.defaultLineGap = nonNegative(get(*sync, "default_line_gap", 5.0),
                                         "default_line_gap");
        cfg.lastLineDuration = nonNegative(
                get(*sync, "last_line_duration", 3.0), "last_line_duration");
        cfg.minGapDuration = nonNegative(get(*sync, "min_gap_duration", 0.5),
                                         "min_gap_duration");
        cfg.minPushedDuration = nonNegative(
                get(*sync, "min_pushed_duration", 0.5), "min_pushed_duration");
    }
}

void ConfigParsers::parseTimeline(const toml::table& tbl, TimelineConfig& cfg) {
    if (auto tl = tbl["timeline"].as_table()) {
        cfg.introOffset =
                nonNegative(get(*tl, "intro_offset", 0.0), "intro_offset");
        cfg.speedFactor = std::clamp(get(*tl, "speed_factor", 1.0), 0.25, 4.0);
        cfg.trimThreshold =
                nonNegative(get(*tl, "trim_threshold", 0.0), "trim_threshold");
        cfg.trimLeadIn =
                nonNegative(get(*tl, "trim_lead_in", 5.0), "trim_lead_in");
    }
}

void ConfigParsers::parseOutput(const toml::table& tbl, OutputConfig& cfg) {
    if (auto out = tbl["output"].as_table()) {
        cfg.pretty = get(*out, "pretty", true);
        cfg.includeMatched = get(*out, "include_matched", true);
    }
}

toml::table ConfigParsers::serialize(const SyncConfig& sync,
                                     const TimelineConfig& timeline,
                                     const OutputConfig& output,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("sync",
                toml::table{
                        {"min_line_duration", sync.minLineDuration},
                        {"global_offset_threshold", sync.globalOffsetThreshold},
                        {"window_margin", sync.windowMargin},
                        {"min_token_length", (i64)sync.minTokenLength},
                        {"default_line_gap", sync.defaultLineGap},
                        {"last_line_duration", sync.lastLineDuration},
                        {"min_gap_duration", sync.minGapDuration},
                        {"min_pushed_duration", sync.minPushedDuration}});
    root.insert("timeline",
                toml::table{{"intro_offset", timeline.introOffset},
                            {"speed_factor", timeline.speedFactor},
                            {"trim_threshold", timeline.trimThreshold},
                            {"trim_lead_in", timeline.trimLeadIn}});
    root.insert("output",
                toml::table{{"pretty", output.pretty},
                            {"include_matched", output.includeMatched}});
    return root;
}

} // namespace ks
