#pragma once

#include "core/types.h"
#include "errors.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lumiere {

/**
 * @brief Stateless PCM conversions between the audio devices and the transport
 *
 * Wire format in both directions: 16-bit signed little-endian mono PCM,
 * base64-encoded for the text-framed transport.
 */
namespace codec {

/**
 * @brief Convert one float sample in [-1, 1] to int16
 *
 * Scales by 32768 and truncates toward zero; out-of-range input saturates.
 */
Sample float_to_pcm16(float sample);

/// int16 to float in [-1, 1)
float pcm16_to_float(Sample sample);

/// Pack samples as little-endian bytes
std::vector<uint8_t> pack_le16(const PcmBuffer& samples);

/// Unpack little-endian bytes; fails on odd byte counts
Result<PcmBuffer> unpack_le16(const std::vector<uint8_t>& bytes);

/// RFC 4648 base64 with padding
std::string to_base64(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode base64 text
 *
 * Whitespace is skipped and missing trailing padding is accepted.
 * @return Bytes, or nullopt for invalid characters or a dangling character
 */
std::optional<std::vector<uint8_t>> from_base64(const std::string& text);

/**
 * @brief Encode a captured frame for the transport
 * @param frame Float samples in [-1, 1]
 * @return base64 text of the int16 LE payload (empty for an empty frame)
 */
std::string encode_outbound(const AudioFrame& frame);

/**
 * @brief Decode a transport payload into a playable buffer
 * @param payload base64 text of int16 LE PCM
 * @param sample_rate Rate dictated by the session (output rate)
 * @return Buffer, or CodecError for invalid base64, odd length or empty audio
 */
Result<PlaybackBuffer> decode_inbound(const std::string& payload, int sample_rate);

} // namespace codec

} // namespace lumiere
