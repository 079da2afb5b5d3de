// Constants and definitions
#pragma once

namespace protonlink {

// Directories
constexpr const char *DEFAULT_EXTRACT_DIR =
    "~/.steam/steam/compatibilitytools.d";
constexpr const char *CONFIG_SUBDIR = "protonlink";
constexpr const char *CONFIG_FILENAME = "config.toml";

// Link names are built as <base><suffix>
constexpr const char *FALLBACK_SUFFIX = "-Fallback";
constexpr const char *FALLBACK2_SUFFIX = "-Fallback2";

// Number of retained pointers per release family
constexpr int SLOT_COUNT = 3;

} // namespace protonlink
