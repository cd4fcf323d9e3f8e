#ifndef FRAME_SINK_HPP
#define FRAME_SINK_HPP

#include "bitmap.hpp"

#include <string>

/**
 * Frame Sink Interface
 *
 * Receives finished frames from the service loop.
 * Implementations: PnmFrameSink (file), MockFrameSink (tests)
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    /**
     * Prepare the output.
     */
    virtual bool init() = 0;

    /**
     * Hand over one frame in engine orientation. Failures are not logged
     * here; the caller reports them once, using lastError().
     */
    virtual bool present(const Bitmap &frame) = 0;

    /**
     * Why the last present() failed, empty after a success.
     */
    virtual std::string lastError() const { return std::string(); }
};

#endif // FRAME_SINK_HPP
