#ifndef PNM_FRAME_SINK_HPP
#define PNM_FRAME_SINK_HPP

#include "frame_sink.hpp"

#include <cstdint>
#include <string>
#include <vector>

/**
 * PnmFrameSink - Writes the latest frame to a PBM/PPM file
 *
 * MONO frames become PBM (P4), colour frames PPM (P6). The panel
 * rotation is applied here. Each frame replaces the file atomically
 * (write to "<path>.tmp", then rename).
 */
class PnmFrameSink : public FrameSink {
public:
    PnmFrameSink(const std::string &path, int rotate_deg);

    bool init() override;
    bool present(const Bitmap &frame) override;
    std::string lastError() const override { return m_last_error; }

    uint64_t framesWritten() const { return m_frames; }

    /**
     * Encode a frame as a complete PNM image (no rotation).
     */
    static std::vector<uint8_t> encode(const Bitmap &frame);

private:
    std::string m_path;
    int m_quarter_turns;
    uint64_t m_frames = 0;
    std::string m_last_error;
};

#endif // PNM_FRAME_SINK_HPP
