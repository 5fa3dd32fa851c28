#pragma once

/// @file bandprint.h
/// @brief Main header for bandprint - audio fingerprinting and take matching.
/// @details Include this file to access all bandprint functionality.

// Version information
#define BANDPRINT_VERSION_MAJOR 1
#define BANDPRINT_VERSION_MINOR 0
#define BANDPRINT_VERSION_PATCH 0
#define BANDPRINT_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/audio.h"
#include "core/audio_io.h"
#include "core/convert.h"
#include "core/fft.h"
#include "core/resample.h"
#include "core/spectrum.h"
#include "core/window.h"

// Filters
#include "filters/bands.h"
#include "filters/chroma.h"
#include "filters/filterbank.h"

// Fingerprints
#include "fingerprint/algorithm.h"
#include "fingerprint/band_extractor.h"
#include "fingerprint/chroma_extractor.h"
#include "fingerprint/extractor.h"
#include "fingerprint/peak_extractor.h"
#include "fingerprint/signature.h"

// Storage
#include "store/fingerprint_store.h"
#include "store/folder_cache.h"

// Matching
#include "match/corpus.h"
#include "match/match_engine.h"
#include "match/scoring.h"

// Batches and collaborators
#include "generation/generation_coordinator.h"
#include "io/audio_decoder.h"
#include "io/audio_file_source.h"

// Facade
#include "service/fingerprint_service.h"

namespace bandprint {

/// @brief Returns the library version string.
inline const char* version() { return BANDPRINT_VERSION_STRING; }

}  // namespace bandprint
