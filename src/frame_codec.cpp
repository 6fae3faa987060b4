#include "frame_codec.h"
#include "core/constants.h"
#include <mbedtls/base64.h>
#include <cctype>
#include <cmath>
#include <limits>

namespace lumiere {
namespace codec {

Sample float_to_pcm16(float sample) {
    if (std::isnan(sample)) return 0;
    float scaled = sample * constants::audio::PCM_SCALE;
    if (scaled >= static_cast<float>(std::numeric_limits<Sample>::max())) {
        return std::numeric_limits<Sample>::max();
    }
    if (scaled <= static_cast<float>(std::numeric_limits<Sample>::min())) {
        return std::numeric_limits<Sample>::min();
    }
    return static_cast<Sample>(scaled);
}

float pcm16_to_float(Sample sample) {
    return static_cast<float>(sample) / constants::audio::PCM_SCALE;
}

std::vector<uint8_t> pack_le16(const PcmBuffer& samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (Sample s : samples) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
    }
    return bytes;
}

Result<PcmBuffer> unpack_le16(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 2 != 0) {
        return make_codec_error("odd byte count " + std::to_string(bytes.size()) + " for 16-bit PCM");
    }
    PcmBuffer samples;
    samples.reserve(bytes.size() / 2);
    for (size_t i = 0; i < bytes.size(); i += 2) {
        uint16_t u = static_cast<uint16_t>(bytes[i]) | (static_cast<uint16_t>(bytes[i + 1]) << 8);
        samples.push_back(static_cast<Sample>(u));
    }
    return samples;
}

std::string to_base64(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return "";
    size_t olen = 0;
    // First call only sizes the output (length includes the terminating NUL)
    mbedtls_base64_encode(nullptr, 0, &olen, bytes.data(), bytes.size());
    std::vector<unsigned char> out(olen);
    if (mbedtls_base64_encode(out.data(), out.size(), &olen, bytes.data(), bytes.size()) != 0) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(out.data()), olen);
}

std::optional<std::vector<uint8_t>> from_base64(const std::string& text) {
    std::string padded;
    padded.reserve(text.size() + 2);
    for (unsigned char c : text) {
        if (!std::isspace(c)) padded.push_back(static_cast<char>(c));
    }
    if (padded.empty()) return std::vector<uint8_t>();
    if (padded.size() % 4 == 1) return std::nullopt;
    while (padded.size() % 4 != 0) padded.push_back('=');

    const auto* src = reinterpret_cast<const unsigned char*>(padded.data());
    size_t olen = 0;
    int rc = mbedtls_base64_decode(nullptr, 0, &olen, src, padded.size());
    if (rc == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) return std::nullopt;

    std::vector<uint8_t> out(olen);
    if (olen == 0) return out;
    rc = mbedtls_base64_decode(out.data(), out.size(), &olen, src, padded.size());
    if (rc != 0) return std::nullopt;
    out.resize(olen);
    return out;
}

std::string encode_outbound(const AudioFrame& frame) {
    if (frame.empty()) return "";

    PcmBuffer pcm;
    pcm.reserve(frame.size());
    for (float s : frame) {
        pcm.push_back(float_to_pcm16(s));
    }
    std::vector<uint8_t> bytes = pack_le16(pcm);
    return to_base64(bytes);
}

Result<PlaybackBuffer> decode_inbound(const std::string& payload, int sample_rate) {
    if (sample_rate <= 0) {
        return make_codec_error("invalid sample rate " + std::to_string(sample_rate));
    }

    auto bytes = from_base64(payload);
    if (!bytes) {
        return make_codec_error("payload is not valid base64");
    }
    if (bytes->empty()) {
        return make_codec_error("empty audio payload");
    }

    auto pcm = unpack_le16(*bytes);
    if (pcm.is_error()) {
        return pcm.error();
    }

    PlaybackBuffer buffer;
    buffer.sample_rate = sample_rate;
    buffer.samples.reserve(pcm.value().size());
    for (Sample s : pcm.value()) {
        buffer.samples.push_back(pcm16_to_float(s));
    }
    return buffer;
}

} // namespace codec
} // namespace lumiere
