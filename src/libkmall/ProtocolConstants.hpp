/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Protocol constants for the Kongsberg KMALL datagram format
 *
 * Datagram tags, fixed struct sizes and sentinel values. Field layouts follow
 * the Kongsberg EMdgmFormat definition (revision F/H). All multi-byte values on
 * disk are little-endian.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace kmall {

// ============================================================================
// Datagram framing
// ============================================================================

/// Every datagram tag starts with this marker character
constexpr char DATAGRAM_TAG_MARKER = '#';

/// Number of characters in a datagram tag, e.g. "#MRZ"
constexpr size_t DATAGRAM_TAG_LENGTH = 4;

/// Size of the leading length field
constexpr size_t LENGTH_FIELD_SIZE = 4;

/// Size of EMdgmHeader: length, tag, version, system id, echosounder id, sec, nanosec
constexpr size_t DATAGRAM_HEADER_SIZE = 20;

/// Smallest legal datagram: header plus trailing length field
constexpr size_t MIN_DATAGRAM_SIZE = DATAGRAM_HEADER_SIZE + LENGTH_FIELD_SIZE;

/// Sanity limit for a single datagram. Merged #MWC datagrams can get large.
constexpr uint32_t MAX_DATAGRAM_SIZE = 256u * 1024u * 1024u;

/// Bytes scanned per chunk while resynchronizing after a malformed datagram
constexpr size_t RESYNC_CHUNK_SIZE = 64 * 1024;

// ============================================================================
// Vendor datagram tags
// ============================================================================

// I-datagrams
constexpr const char *TAG_INSTALLATION_PARAM = "#IIP";
constexpr const char *TAG_RUNTIME_PARAM = "#IOP";
constexpr const char *TAG_BIST_ERROR = "#IBE";
constexpr const char *TAG_BIST_REPLY = "#IBR";
constexpr const char *TAG_BIST_SHORT = "#IBS";

// S-datagrams
constexpr const char *TAG_POSITION = "#SPO";
constexpr const char *TAG_KM_BINARY = "#SKM";
constexpr const char *TAG_SOUND_VELOCITY_PROFILE = "#SVP";
constexpr const char *TAG_SOUND_VELOCITY_TRANSDUCER = "#SVT";
constexpr const char *TAG_CLOCK = "#SCL";
constexpr const char *TAG_DEPTH = "#SDE";
constexpr const char *TAG_HEIGHT = "#SHI";
constexpr const char *TAG_HEADING = "#SHA";

// M-datagrams
constexpr const char *TAG_RANGE_AND_DEPTH = "#MRZ";
constexpr const char *TAG_WATER_COLUMN = "#MWC";

// C-datagrams
constexpr const char *TAG_COMPATIBILITY_POSITION = "#CPO";
constexpr const char *TAG_COMPATIBILITY_HEAVE = "#CHE";

// ============================================================================
// Synthetic (compressed) datagram tags
// ============================================================================

/// Quantized #MRZ/#MWC, seabed image kept
constexpr const char *TAG_QUANTIZED_LEVEL0 = "#QZ0";

/// Quantized #MRZ, seabed image dropped
constexpr const char *TAG_QUANTIZED_LEVEL1 = "#QZ1";

/// Version of the quantized body layout written by this library
constexpr uint8_t QUANTIZED_CODEC_VERSION = 1;

/// Highest retention level understood by the codec
constexpr uint8_t MAX_RETENTION_LEVEL = 1;

/// Extension used by KMALL files
constexpr const char *KMALL_EXTENSION = ".kmall";

/// Filename infix for compressed output; the level digit follows
constexpr const char *COMPRESSED_SUFFIX_PREFIX = ".qz";

/// Filename infix for decompressed output
constexpr const char *RESTORED_SUFFIX = ".restored";

/// Appended to an output path while the codec is still writing it
constexpr const char *PARTIAL_OUTPUT_SUFFIX = ".partial";

// ============================================================================
// Fixed struct sizes (bytes)
// ============================================================================

/// EMdgmMpartition
constexpr size_t M_PARTITION_SIZE = 4;

/// EMdgmMbody
constexpr size_t M_BODY_SIZE = 12;

/// EMdgmMRZ_pingInfo
constexpr size_t MRZ_PING_INFO_SIZE = 144;

/// EMdgmMRZ_txSectorInfo
constexpr size_t MRZ_TX_SECTOR_INFO_SIZE = 36;

/// EMdgmMRZ_rxInfo
constexpr size_t MRZ_RX_INFO_SIZE = 32;

/// EMdgmMRZ_extraDetClassInfo
constexpr size_t MRZ_EXTRA_DET_CLASS_INFO_SIZE = 4;

/// EMdgmMRZ_sounding
constexpr size_t MRZ_SOUNDING_SIZE = 120;

/// EMdgmMWCtxInfo
constexpr size_t MWC_TX_INFO_SIZE = 12;

/// EMdgmMWCtxSectorData
constexpr size_t MWC_TX_SECTOR_DATA_SIZE = 16;

/// EMdgmMWCrxInfo
constexpr size_t MWC_RX_INFO_SIZE = 16;

/// EMdgmMWCrxBeamData, excluding the sample arrays
constexpr size_t MWC_RX_BEAM_DATA_SIZE = 12;

/// EMdgmScommon
constexpr size_t S_COMMON_SIZE = 8;

/// EMdgmSKMinfo
constexpr size_t SKM_INFO_SIZE = 12;

/// KMbinary sample within #SKM
constexpr size_t SKM_KM_BINARY_SIZE = 120;

/// KMdelayedHeave sample within #SKM
constexpr size_t SKM_DELAYED_HEAVE_SIZE = 12;

/// EMdgmSVTinfo
constexpr size_t SVT_INFO_SIZE = 20;

/// EMdgmSVTsample
constexpr size_t SVT_SAMPLE_SIZE = 24;

/// EMdgmSVP common part, excluding the sample points
constexpr size_t SVP_COMMON_SIZE = 28;

/// EMdgmIIP / EMdgmIOP fixed part before the text
constexpr size_t I_PARAM_FIXED_SIZE = 6;

/// Quantized datagram preamble: level, codec version, reserved, original tag
constexpr size_t QUANTIZED_PREAMBLE_SIZE = 8;

// ============================================================================
// Water column phase flags
// ============================================================================

constexpr uint8_t MWC_PHASE_NONE = 0;
constexpr uint8_t MWC_PHASE_LOW_RES = 1;
constexpr uint8_t MWC_PHASE_HIGH_RES = 2;

// ============================================================================
// Sentinels
// ============================================================================

/// Latitude value used by the PU when no position is available
constexpr double UNAVAILABLE_LATITUDE = 200.0;

/// Longitude value used by the PU when no position is available
constexpr double UNAVAILABLE_LONGITUDE = 200.0;

// ============================================================================
// Integrity checking
// ============================================================================

/// Ping counter is a 16-bit field and wraps
constexpr uint32_t PING_COUNTER_MODULUS = 65536;

/// A backwards step larger than this is treated as a counter wrap
constexpr uint32_t PING_COUNTER_WRAP_THRESHOLD = PING_COUNTER_MODULUS / 2;

/// Default ping counter increment between consecutive pings
constexpr int DEFAULT_PING_INCREMENT = 1;

/// Default navigation gap threshold in seconds
constexpr double DEFAULT_NAV_GAP_THRESHOLD_SEC = 1.0;

/// Nanoseconds per second, for combining header timestamps
constexpr double NANOSEC_PER_SEC = 1.0e9;

} // namespace kmall
