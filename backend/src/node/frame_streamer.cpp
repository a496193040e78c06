/**
 * FrameStreamer - Paced sending of pre-sliced media frames.
 */

#include "node/frame_streamer.h"

#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

std::size_t stream_frames(PeerClient& client, std::vector<VoipFrame> frames,
                          std::chrono::milliseconds interval, const std::atomic<bool>& stopping) {
    std::size_t queued = 0;
    try {
        for (auto& frame : frames) {
            if (stopping.load()) break;
            client.enqueue_outbound(std::move(frame), [](const std::error_code& ec) {
                if (ec) spdlog::warn("Frame not sent: {}", ec.message());
            });
            ++queued;
            std::this_thread::sleep_for(interval);
        }
    } catch (const std::system_error& e) {
        spdlog::info("Sender stopped after {} frames: {}", queued, e.what());
    }
    return queued;
}
