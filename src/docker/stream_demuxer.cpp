/**
 * @file stream_demuxer.cpp
 * @brief Implementation of the multiplexed stream frame parser
 *
 * @date 2025
 */

#include "noritest/docker/stream_demuxer.hpp"
#include "noritest/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace noritest {
namespace docker {

namespace {

constexpr std::uint8_t TAG_STDERR = 2;
constexpr std::uint8_t TAG_SYSTEM_ERROR = 3;

} // anonymous namespace

StreamDemuxer::StreamDemuxer(Sink sink)
    : sink_(std::move(sink)) {
}

void StreamDemuxer::Feed(const char* data, std::size_t size) {
    std::size_t offset = 0;

    while (offset < size) {
        if (!in_payload_) {
            // Accumulate the 8-byte header
            std::size_t take = std::min(HEADER_SIZE - header_filled_, size - offset);
            std::copy(data + offset, data + offset + take, header_.begin() + header_filled_);
            header_filled_ += take;
            offset += take;

            if (header_filled_ == HEADER_SIZE) {
                ParseHeader();
            }
            continue;
        }

        std::size_t take = std::min<std::size_t>(remaining_, size - offset);
        payload_.append(data + offset, take);
        remaining_ -= static_cast<std::uint32_t>(take);
        offset += take;

        if (remaining_ == 0) {
            Deliver();
        }
    }
}

void StreamDemuxer::ParseHeader() {
    tag_ = header_[0];
    remaining_ = (static_cast<std::uint32_t>(header_[4]) << 24) |
                 (static_cast<std::uint32_t>(header_[5]) << 16) |
                 (static_cast<std::uint32_t>(header_[6]) << 8) |
                 static_cast<std::uint32_t>(header_[7]);
    header_filled_ = 0;

    if (tag_ > TAG_SYSTEM_ERROR) {
        throw core::DemuxError("unknown stream tag " + std::to_string(tag_));
    }

    if (remaining_ == 0) {
        return;
    }

    in_payload_ = true;
    payload_.clear();
    payload_.reserve(remaining_);
}

void StreamDemuxer::Deliver() {
    in_payload_ = false;

    if (tag_ == TAG_SYSTEM_ERROR) {
        throw core::DemuxError("engine reported: " + payload_);
    }

    // stdin echo is routed with stdout, as the engine's own client does
    core::OutputOrigin origin = (tag_ == TAG_STDERR) ? core::OutputOrigin::STDERR
                                                     : core::OutputOrigin::STDOUT;
    ++frames_delivered_;
    bytes_delivered_ += payload_.size();
    sink_(origin, payload_);
    payload_.clear();
}

bool StreamDemuxer::Finish() {
    if (in_payload_) {
        spdlog::warn("Output stream closed mid-frame ({} bytes missing)", remaining_);
        if (!payload_.empty()) {
            remaining_ = 0;
            Deliver();
        }
        in_payload_ = false;
        return false;
    }
    if (header_filled_ != 0) {
        spdlog::warn("Output stream closed inside a frame header");
        header_filled_ = 0;
        return false;
    }
    return true;
}

} // namespace docker
} // namespace noritest
