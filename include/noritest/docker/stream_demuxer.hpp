/**
 * @file stream_demuxer.hpp
 * @brief Splits the engine's multiplexed stdout/stderr stream
 *
 * When a container runs without a TTY the engine carries both output
 * streams over one connection, framed as:
 *
 * ```
 * +--------+-----------+---------------------------+
 * | 1 byte | 3 bytes   | 4 bytes (big-endian)      |
 * | stream | reserved  | payload length            |
 * +--------+-----------+---------------------------+
 * | payload (length bytes)                          |
 * +-------------------------------------------------+
 * ```
 *
 * Stream tags: 0 = stdin, 1 = stdout, 2 = stderr, 3 = engine error.
 *
 * @date 2025
 */

#pragma once

#include "noritest/core/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace noritest {
namespace docker {

/**
 * @class StreamDemuxer
 * @brief Stateful frame parser feeding two sinks
 *
 * Bytes may be fed in arbitrary pieces; a frame split across Feed() calls is
 * reassembled and delivered once complete. Frames with an empty payload are
 * skipped.
 *
 * **Thread Safety**: NOT thread-safe. Feed from a single reader.
 */
class StreamDemuxer {
public:
    static constexpr std::size_t HEADER_SIZE = 8;

    using Sink = std::function<void(core::OutputOrigin, std::string_view)>;

    explicit StreamDemuxer(Sink sink);

    /**
     * @brief Consume bytes read from the multiplexed stream
     * @throws core::DemuxError on an unknown tag or an engine error frame
     */
    void Feed(const char* data, std::size_t size);

    /**
     * @brief Signal end of stream
     *
     * A partially received frame is delivered as-is and logged.
     * @return true if the stream ended on a frame boundary
     */
    bool Finish();

    std::uint64_t FramesDelivered() const { return frames_delivered_; }
    std::uint64_t BytesDelivered() const { return bytes_delivered_; }

private:
    void ParseHeader();
    void Deliver();

    Sink sink_;
    std::array<unsigned char, HEADER_SIZE> header_{};
    std::size_t header_filled_{0};
    std::uint8_t tag_{0};
    std::uint32_t remaining_{0};
    bool in_payload_{false};
    std::string payload_;
    std::uint64_t frames_delivered_{0};
    std::uint64_t bytes_delivered_{0};
};

} // namespace docker
} // namespace noritest
