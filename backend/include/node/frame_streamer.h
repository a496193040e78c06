#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <vector>

#include "network/peer_client.h"

/**
 * Queue frames on a client one at a time, sleeping `interval` after each.
 *
 * Stops early when `stopping` is set or the client is shut down. Returns the
 * number of frames queued. Blocks the calling thread, so the client's
 * io_context has to keep running on another thread until this returns.
 */
std::size_t stream_frames(PeerClient& client, std::vector<VoipFrame> frames,
                          std::chrono::milliseconds interval, const std::atomic<bool>& stopping);
