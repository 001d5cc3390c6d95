#pragma once

// Compile-time defaults for the host-side library.
//
// Only BOILERLINK_DEFAULT_BAUDRATE must match the controller; the rest are
// local tuning and can be overridden from the build (-DBOILERLINK_...).

// --- Serial link ---

// Froling S3/S4 Turbo service interface runs at 57600 8N1.
#ifndef BOILERLINK_DEFAULT_BAUDRATE
#define BOILERLINK_DEFAULT_BAUDRATE 57600UL
#endif

// Per-read timeout while waiting for the controller's reply.
#ifndef BOILERLINK_DEFAULT_READ_TIMEOUT_MS
#define BOILERLINK_DEFAULT_READ_TIMEOUT_MS 1000UL
#endif

// Controllers with checksum quirks exist, so replies are accepted unchecked
// unless the caller asks otherwise.
#ifndef BOILERLINK_DEFAULT_VALIDATE_CHECKSUM
#define BOILERLINK_DEFAULT_VALIDATE_CHECKSUM 0
#endif

// --- TCP proxy ---

// Longest accepted command line (hex characters, terminator excluded).
// Two characters per byte of the largest frame body plus slack.
#ifndef BOILERLINK_MAX_LINE_LENGTH
#define BOILERLINK_MAX_LINE_LENGTH 131072UL
#endif

#ifndef BOILERLINK_LISTEN_BACKLOG
#define BOILERLINK_LISTEN_BACKLOG 16
#endif
