#pragma once

constexpr const char* TPLREG_VERSION          = "0.2.0";

// ── Manifest ────────────────────────────────────────────────
constexpr const char* MANIFEST_FILENAME       = "tplreg.yaml";

// ── Template directories ────────────────────────────────────
// A module without an explicit templatedir looks in "<name>_templates".
constexpr const char* TEMPLATE_DIR_SUFFIX     = "_templates";

// Renderers drop "<name>.cache" files beside their sources.
constexpr const char* CACHE_FILE_EXTENSION    = ".cache";

// ── Builtin template kinds ──────────────────────────────────
constexpr const char* KIND_PAGE               = "page";
constexpr const char* KIND_TEXT               = "text";
constexpr const char* DEFAULT_PAGE_EXTENSION  = "pt";
