/*
 * File: flow.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

namespace chunkio::stream {

    // Direction a read walks the record file in.
    // forward starts at offset 0, backward anchors on the end of the file.
    enum class stream_flow {
        forward,
        backward,
    };

} // namespace chunkio::stream
