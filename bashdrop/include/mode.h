/*
 * mode.h
 *
 * Transfer modes and the byte-level framing each one asks of the peers.
 *
 * A mode is a property of the session and is only ever communicated
 * out-of-band, through the commands the relay prints. Nothing here is
 * consulted while bytes are being forwarded: to the relay every mode is
 * an opaque byte stream.
 *
 *   PLAIN                file bytes, nothing else
 *   INTEGRITY            file bytes || sha256(file) as 64 lowercase hex chars
 *   ENCRYPTED_INTEGRITY  cipher(file bytes || sha256 hex), password-derived key
 */

#ifndef BASHDROP_MODE_H
#define BASHDROP_MODE_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace bashdrop {

enum class TransferMode : uint8_t {
    PLAIN = 0,
    INTEGRITY = 1,
    ENCRYPTED_INTEGRITY = 2
};

/*
 * ModeDescriptor
 *
 * Static description of a mode, handed to the display layer.
 */
struct ModeDescriptor {
    TransferMode mode;
    const char* name;        /* command-line spelling, e.g. "integrity" */
    const char* label;       /* human-readable heading */
    size_t trailer_size;     /* checksum bytes appended after the file, 0 if none */
    bool encrypted;
    const char* cipher;      /* openssl enc cipher arguments, empty if not encrypted */
};

const ModeDescriptor& mode_descriptor(TransferMode mode);

/* All modes, in the order they are advertised. */
const std::vector<TransferMode>& all_modes();

const char* mode_name(TransferMode mode);

/*
 * Parses a command-line mode name. Accepts "plain", "integrity",
 * "encrypted" (and "encrypted-integrity").
 *
 * @return true on success, false for an unknown name
 */
bool parse_mode(const std::string& name, TransferMode& out);

/*
 * Peer-side helpers for the INTEGRITY trailer. The relay never calls these;
 * they document the framing and let programmatic peers produce and check it.
 */
namespace integrity {

/*
 * Returns file || sha256_hex(file).
 */
std::vector<uint8_t> append_trailer(const std::vector<uint8_t>& file);

/*
 * Splits a received stream into file bytes and trailer and checks the
 * digest. On success the file bytes are written to file_out.
 *
 * @return false if the stream is shorter than the trailer or the digest
 *         does not match (truncated or corrupted transfer)
 */
bool verify_trailer(const std::vector<uint8_t>& stream, std::vector<uint8_t>& file_out);

}  // namespace integrity

}  // namespace bashdrop

#endif  // BASHDROP_MODE_H
