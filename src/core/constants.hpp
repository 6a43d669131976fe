#pragma once

#include <cstddef>

// ── Version ─────────────────────────────────────────────────
constexpr const char* PENLAB_VERSION = "1.0.0";

// ── Well-known file names ───────────────────────────────────
constexpr const char* PROJECT_METADATA_FILE = ".penlab.yaml";   // at project root
constexpr const char* PROJECT_STATE_DIR     = ".penlab";        // per-project private dir
constexpr const char* NOTES_FILE            = "notes.yaml";     // inside PROJECT_STATE_DIR
constexpr const char* CONFIG_FILE_NAME      = "config.yaml";
constexpr const char* TEMPLATES_DIR_NAME    = "templates";
constexpr const char* TEMPLATE_EXTENSION    = ".yaml";
constexpr const char* TEMPLATE_EXTENSION_ALT = ".yml";
constexpr const char* PENLAB_HOME_ENV       = "PENLAB_HOME";

// ── Name sanitization ───────────────────────────────────────
constexpr std::size_t MAX_SEGMENT_LENGTH = 255;
constexpr char DIR_REPLACEMENT  = '-';
constexpr char FILE_REPLACEMENT = '_';

// ── Variable defaults ───────────────────────────────────────
constexpr const char* DEFAULT_TEMPLATE      = "default";
constexpr const char* FALLBACK_TARGET       = "TARGET_IP";
constexpr const char* FALLBACK_YOUR_IP      = "10.10.x.x";
constexpr const char* FALLBACK_AUTHOR       = "pentester";
constexpr const char* DEFAULT_CONFIG_YOUR_IP = "10.10.14.x";

// ── Variable keys ───────────────────────────────────────────
constexpr const char* VAR_PROJECT_NAME = "project-name";
constexpr const char* VAR_TARGET       = "target";
constexpr const char* VAR_YOUR_IP      = "your-ip";
constexpr const char* VAR_DATE         = "date";
constexpr const char* VAR_AUTHOR       = "author";

// ── Permissions ─────────────────────────────────────────────
constexpr unsigned EXECUTABLE_MODE = 0755;
