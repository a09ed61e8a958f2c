/**
 * @file libmarc.h
 * @brief libmarc - ISO 2709 (MARC 21) record codec and streaming reader
 * @version 0.1.0
 *
 * Main public header for the libmarc library.
 */

#ifndef LIBMARC_H
#define LIBMARC_H

#define LIBMARC_VERSION_MAJOR 0
#define LIBMARC_VERSION_MINOR 1
#define LIBMARC_VERSION_PATCH 0
#define LIBMARC_VERSION_STRING "0.1.0"

// Core types
#include "libmarc/error.h"
#include "libmarc/options.h"
#include "libmarc/types.h"

// Record model and codec
#include "libmarc/leader.h"
#include "libmarc/record.h"
#include "libmarc/record_decoder.h"
#include "libmarc/record_encoder.h"

// Scanning and parallel decode
#include "libmarc/boundary_scanner.h"
#include "libmarc/decode_pool.h"
#include "libmarc/record_bytes.h"

// Sources and readers
#include "libmarc/batched_reader.h"
#include "libmarc/byte_source.h"
#include "libmarc/host.h"
#include "libmarc/mmap_source.h"
#include "libmarc/pipeline.h"
#include "libmarc/record_channel.h"
#include "libmarc/stream_item.h"

#include "libmarc/logging.h"

#endif // LIBMARC_H
