/**
 * EyeCommand Implementation
 *
 * Uses nlohmann/json for parsing.
 */

#include "eye_command.hpp"
#include "logger.h"

#include <cmath>
#include <nlohmann/json.hpp>

extern "C" {
#include "eye_event_protocol.h"
}

using json = nlohmann::json;

const char *toString(CommandType type) {
    switch (type) {
        case CommandType::MOOD:     return ROBOEYES_EVT_MOOD;
        case CommandType::LOOK:     return ROBOEYES_EVT_LOOK;
        case CommandType::BLINK:    return ROBOEYES_EVT_BLINK;
        case CommandType::CLOSE:    return ROBOEYES_EVT_CLOSE;
        case CommandType::OPEN:     return ROBOEYES_EVT_OPEN;
        case CommandType::CURIOUS:  return ROBOEYES_EVT_CURIOUS;
        case CommandType::IDLE:     return ROBOEYES_EVT_IDLE;
        case CommandType::COVERAGE: return ROBOEYES_EVT_COVERAGE;
        case CommandType::WAKEUP:   return ROBOEYES_EVT_WAKEUP;
        case CommandType::STATUS:   return ROBOEYES_EVT_STATUS;
    }
    return "unknown";
}

// Builders

EyeCommand EyeCommand::makeMood(Mood mood) {
    EyeCommand c;
    c.type = CommandType::MOOD;
    c.mood = mood;
    return c;
}

EyeCommand EyeCommand::makeLook(Direction direction, Speed speed) {
    EyeCommand c;
    c.type = CommandType::LOOK;
    c.direction = direction;
    c.speed = speed;
    return c;
}

EyeCommand EyeCommand::makeBlink(Speed speed, EyeSelector eyes) {
    EyeCommand c;
    c.type = CommandType::BLINK;
    c.speed = speed;
    c.eyes = eyes;
    return c;
}

EyeCommand EyeCommand::makeClose(Speed speed, EyeSelector eyes) {
    EyeCommand c = makeBlink(speed, eyes);
    c.type = CommandType::CLOSE;
    return c;
}

EyeCommand EyeCommand::makeOpen(Speed speed, EyeSelector eyes) {
    EyeCommand c = makeBlink(speed, eyes);
    c.type = CommandType::OPEN;
    return c;
}

EyeCommand EyeCommand::makeCurious(bool enabled) {
    EyeCommand c;
    c.type = CommandType::CURIOUS;
    c.enabled = enabled;
    return c;
}

EyeCommand EyeCommand::makeIdle(bool enabled) {
    EyeCommand c;
    c.type = CommandType::IDLE;
    c.enabled = enabled;
    return c;
}

EyeCommand EyeCommand::makeCoverage(float top, float bottom, EyeSelector eyes) {
    EyeCommand c;
    c.type = CommandType::COVERAGE;
    c.top = top;
    c.bottom = bottom;
    c.eyes = eyes;
    return c;
}

// Parsing

namespace {

using ParseResult = EyeCommandParser::ParseResult;

ParseResult invalid(const std::string &error) {
    ParseResult result;
    result.valid = false;
    result.error = error;
    return result;
}

// Optional string field. Absent is fine, any other type is an error.
bool readString(const json &msg, const char *key, std::string &out, std::string &error) {
    auto it = msg.find(key);
    if (it == msg.end() || it->is_null()) return true;
    if (!it->is_string()) {
        error = std::string("\"") + key + "\" must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool readSpeed(const json &msg, Speed def, Speed &out, std::string &error) {
    std::string name;
    if (!readString(msg, "speed", name, error)) return false;
    if (name.empty()) {
        out = def;
        return true;
    }
    if (!parseSpeed(name, out)) {
        error = "unknown speed: " + name;
        return false;
    }
    return true;
}

bool readEyes(const json &msg, EyeSelector &out, std::string &error) {
    std::string name;
    if (!readString(msg, "eye", name, error)) return false;
    if (name.empty()) {
        out = EyeSelector::BOTH;
        return true;
    }
    if (!parseEyeSelector(name, out)) {
        error = "unknown eye: " + name;
        return false;
    }
    return true;
}

bool readEnabled(const json &msg, bool &out, std::string &error) {
    auto it = msg.find("enabled");
    if (it == msg.end() || !it->is_boolean()) {
        error = "\"enabled\" must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool readFraction(const json &msg, const char *key, float &out, std::string &error) {
    auto it = msg.find(key);
    if (it == msg.end()) {
        out = 0.0f;
        return true;
    }
    if (!it->is_number()) {
        error = std::string("\"") + key + "\" must be a number";
        return false;
    }
    out = it->get<float>();
    if (!std::isfinite(out)) {
        error = std::string("\"") + key + "\" must be finite";
        return false;
    }
    return true;
}

bool parseLidCommand(const json &msg, EyeCommand &cmd, std::string &error) {
    return readSpeed(msg, Speed::MEDIUM, cmd.speed, error) && readEyes(msg, cmd.eyes, error);
}

}  // namespace

EyeCommandParser::ParseResult EyeCommandParser::parse(const std::string &line) {
    if (line.size() > ROBOEYES_EVENT_MAX_SIZE) {
        return invalid("event too long");
    }

    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::exception &e) {
        return invalid(std::string("malformed JSON: ") + e.what());
    }

    if (!msg.is_object()) {
        return invalid("event must be a JSON object");
    }

    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
        return invalid("missing \"type\"");
    }
    std::string type = type_it->get<std::string>();

    ParseResult result;
    EyeCommand &cmd = result.command;
    std::string error;
    bool ok = true;

    if (type == ROBOEYES_EVT_MOOD) {
        cmd.type = CommandType::MOOD;
        std::string name;
        ok = readString(msg, "mood", name, error);
        if (ok && !parseMood(name, cmd.mood)) {
            error = "unknown mood: " + name;
            ok = false;
        }
    } else if (type == ROBOEYES_EVT_LOOK) {
        cmd.type = CommandType::LOOK;
        std::string name;
        ok = readString(msg, "direction", name, error);
        if (ok && !parseDirection(name, cmd.direction)) {
            error = "unknown direction: " + name;
            ok = false;
        }
        ok = ok && readSpeed(msg, Speed::FAST, cmd.speed, error);
    } else if (type == ROBOEYES_EVT_BLINK) {
        cmd.type = CommandType::BLINK;
        ok = parseLidCommand(msg, cmd, error);
    } else if (type == ROBOEYES_EVT_CLOSE) {
        cmd.type = CommandType::CLOSE;
        ok = parseLidCommand(msg, cmd, error);
    } else if (type == ROBOEYES_EVT_OPEN) {
        cmd.type = CommandType::OPEN;
        ok = parseLidCommand(msg, cmd, error);
    } else if (type == ROBOEYES_EVT_CURIOUS) {
        cmd.type = CommandType::CURIOUS;
        ok = readEnabled(msg, cmd.enabled, error);
    } else if (type == ROBOEYES_EVT_IDLE) {
        cmd.type = CommandType::IDLE;
        ok = readEnabled(msg, cmd.enabled, error);
    } else if (type == ROBOEYES_EVT_COVERAGE) {
        cmd.type = CommandType::COVERAGE;
        ok = readFraction(msg, "top", cmd.top, error) &&
             readFraction(msg, "bottom", cmd.bottom, error) &&
             readEyes(msg, cmd.eyes, error);
    } else if (type == ROBOEYES_EVT_WAKEUP) {
        cmd.type = CommandType::WAKEUP;
    } else if (type == ROBOEYES_EVT_STATUS) {
        cmd.type = CommandType::STATUS;
    } else {
        return invalid("unknown type: " + type);
    }

    if (!ok) {
        return invalid(type + ": " + error);
    }

    result.valid = true;
    return result;
}

CommandResult applyCommand(EyeAnimator &animator, const EyeCommand &command) {
    switch (command.type) {
        case CommandType::MOOD:
            return animator.setMood(command.mood);
        case CommandType::LOOK:
            return animator.look(command.direction, command.speed);
        case CommandType::BLINK:
            return animator.blink(command.speed, command.eyes);
        case CommandType::CLOSE:
            return animator.close(command.speed, command.eyes);
        case CommandType::OPEN:
            return animator.open(command.speed, command.eyes);
        case CommandType::CURIOUS:
            return animator.setCurious(command.enabled);
        case CommandType::IDLE:
            animator.setIdleEnabled(command.enabled);
            return CommandResult::success();
        case CommandType::COVERAGE:
            return animator.setEyelidCoverage(command.top, command.bottom, command.eyes);
        case CommandType::WAKEUP:
        case CommandType::STATUS:
            return CommandResult::success();
    }
    LOG_WARN(LOG_TAG_CMD, "Unknown command type %d", static_cast<int>(command.type));
    return CommandResult::invalid("unknown command type");
}

std::string statusToJson(const EyeAnimator::Status &status) {
    json out;
    out["type"] = ROBOEYES_EVT_STATUS;
    out["mood"] = toString(status.mood);
    out["blink_phase"] = toString(status.blink_phase);
    if (status.look_target) {
        out["look_target"] = toString(*status.look_target);
    } else {
        out["look_target"] = nullptr;
    }
    out["curious"] = status.curious;
    out["idle_enabled"] = status.idle_enabled;
    out["held_closed"] = {{"left", status.held_closed_left},
                          {"right", status.held_closed_right}};
    out["queued"] = status.queued_lid_requests;
    out["idle"] = status.idle;
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string errorToJson(EyeError error, const std::string &message) {
    json out;
    out["type"] = "error";
    out["error"] = toString(error);
    out["message"] = message;
    // Parse errors echo raw input bytes, which need not be valid UTF-8
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}
