/**
 * PnmFrameSink Implementation
 */

#include "pnm_frame_sink.hpp"
#include "logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

PnmFrameSink::PnmFrameSink(const std::string &path, int rotate_deg)
    : m_path(path),
      m_quarter_turns(((rotate_deg / 90) % 4 + 4) % 4) {
}

bool PnmFrameSink::init() {
    std::ofstream probe(m_path + ".tmp", std::ios::binary | std::ios::trunc);
    if (!probe.is_open()) {
        LOG_ERROR(LOG_TAG_RENDER, "Cannot open %s.tmp for writing", m_path.c_str());
        return false;
    }
    probe.close();
    std::remove((m_path + ".tmp").c_str());

    LOG_INFO(LOG_TAG_RENDER, "Writing frames to %s (rotate %d)",
             m_path.c_str(), m_quarter_turns * 90);
    return true;
}

std::vector<uint8_t> PnmFrameSink::encode(const Bitmap &frame) {
    char header[64];
    bool mono = frame.mode() == ColorMode::MONO;
    int n = std::snprintf(header, sizeof(header), "%s\n%d %d\n%s",
                          mono ? "P4" : "P6", frame.width(), frame.height(),
                          mono ? "" : "255\n");

    std::vector<uint8_t> out(header, header + n);

    if (mono) {
        // PBM uses 1 for black, the panel 1 for a lit pixel
        for (uint8_t b : frame.toBytes()) {
            out.push_back(static_cast<uint8_t>(~b));
        }
        return out;
    }

    out.reserve(out.size() + static_cast<size_t>(frame.width()) * frame.height() * 3);
    for (uint32_t px : frame.pixels()) {
        if (frame.mode() == ColorMode::RGB565) {
            uint8_t r = (px >> 11) & 0x1F;
            uint8_t g = (px >> 5) & 0x3F;
            uint8_t b = px & 0x1F;
            out.push_back(static_cast<uint8_t>((r << 3) | (r >> 2)));
            out.push_back(static_cast<uint8_t>((g << 2) | (g >> 4)));
            out.push_back(static_cast<uint8_t>((b << 3) | (b >> 2)));
        } else {
            out.push_back((px >> 16) & 0xFF);
            out.push_back((px >> 8) & 0xFF);
            out.push_back(px & 0xFF);
        }
    }
    return out;
}

bool PnmFrameSink::present(const Bitmap &frame) {
    std::vector<uint8_t> data = m_quarter_turns == 0
        ? encode(frame)
        : encode(frame.rotated(m_quarter_turns));

    std::string tmp = m_path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            m_last_error = "cannot open " + tmp;
            return false;
        }
        file.write(reinterpret_cast<const char *>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file.good()) {
            m_last_error = "write to " + tmp + " failed";
            return false;
        }
    }

    if (std::rename(tmp.c_str(), m_path.c_str()) != 0) {
        m_last_error = "rename " + m_path + ": " + strerror(errno);
        return false;
    }

    m_last_error.clear();
    m_frames++;
    return true;
}
