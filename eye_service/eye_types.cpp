#include "eye_types.hpp"

#include <algorithm>
#include <cctype>

static std::string toLower(const std::string &s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

CommandResult CommandResult::invalid(const std::string &message) {
    CommandResult result;
    result.ok = false;
    result.error = EyeError::INVALID_COMMAND;
    result.message = message;
    return result;
}

bool isValid(Mood mood) {
    return static_cast<uint8_t>(mood) <= static_cast<uint8_t>(Mood::CURIOUS);
}

bool isValid(Direction direction) {
    return static_cast<uint8_t>(direction) <= static_cast<uint8_t>(Direction::BOTTOM_RIGHT);
}

bool isValid(Speed speed) {
    return static_cast<uint8_t>(speed) <= static_cast<uint8_t>(Speed::FAST);
}

bool isValid(EyeSelector eyes) {
    return static_cast<uint8_t>(eyes) <= static_cast<uint8_t>(EyeSelector::RIGHT);
}

bool isValid(Easing easing) {
    return static_cast<uint8_t>(easing) <= static_cast<uint8_t>(Easing::SINE);
}

DirectionStep directionStep(Direction direction) {
    switch (direction) {
        case Direction::LEFT:         return {-1,  0};
        case Direction::RIGHT:        return { 1,  0};
        case Direction::TOP:          return { 0, -1};
        case Direction::BOTTOM:       return { 0,  1};
        case Direction::TOP_LEFT:     return {-1, -1};
        case Direction::TOP_RIGHT:    return { 1, -1};
        case Direction::BOTTOM_LEFT:  return {-1,  1};
        case Direction::BOTTOM_RIGHT: return { 1,  1};
        case Direction::CENTER:
        default:
            return {0, 0};
    }
}

bool selects(EyeSelector eyes, EyeSide side) {
    switch (eyes) {
        case EyeSelector::BOTH:  return true;
        case EyeSelector::LEFT:  return side == EyeSide::LEFT;
        case EyeSelector::RIGHT: return side == EyeSide::RIGHT;
    }
    return false;
}

bool parseMood(const std::string &name, Mood &out) {
    std::string n = toLower(name);
    if (n == "default" || n == "normal") out = Mood::DEFAULT;
    else if (n == "angry") out = Mood::ANGRY;
    else if (n == "tired" || n == "sleepy") out = Mood::TIRED;
    else if (n == "happy") out = Mood::HAPPY;
    else if (n == "curious") out = Mood::CURIOUS;
    else return false;
    return true;
}

bool parseDirection(const std::string &name, Direction &out) {
    std::string n = toLower(name);
    if (n == "c" || n == "center") out = Direction::CENTER;
    else if (n == "l" || n == "left") out = Direction::LEFT;
    else if (n == "r" || n == "right") out = Direction::RIGHT;
    else if (n == "t" || n == "top") out = Direction::TOP;
    else if (n == "b" || n == "bottom") out = Direction::BOTTOM;
    else if (n == "tl" || n == "top_left") out = Direction::TOP_LEFT;
    else if (n == "tr" || n == "top_right") out = Direction::TOP_RIGHT;
    else if (n == "bl" || n == "bottom_left") out = Direction::BOTTOM_LEFT;
    else if (n == "br" || n == "bottom_right") out = Direction::BOTTOM_RIGHT;
    else return false;
    return true;
}

bool parseSpeed(const std::string &name, Speed &out) {
    std::string n = toLower(name);
    if (n == "slow") out = Speed::SLOW;
    else if (n == "medium") out = Speed::MEDIUM;
    else if (n == "fast") out = Speed::FAST;
    else return false;
    return true;
}

bool parseEyeSelector(const std::string &name, EyeSelector &out) {
    std::string n = toLower(name);
    if (n == "both") out = EyeSelector::BOTH;
    else if (n == "left") out = EyeSelector::LEFT;
    else if (n == "right") out = EyeSelector::RIGHT;
    else return false;
    return true;
}

bool parseEasing(const std::string &name, Easing &out) {
    std::string n = toLower(name);
    if (n == "linear") out = Easing::LINEAR;
    else if (n == "smoothstep") out = Easing::SMOOTHSTEP;
    else if (n == "sine") out = Easing::SINE;
    else return false;
    return true;
}

const char *toString(Mood mood) {
    switch (mood) {
        case Mood::DEFAULT: return "default";
        case Mood::ANGRY:   return "angry";
        case Mood::TIRED:   return "tired";
        case Mood::HAPPY:   return "happy";
        case Mood::CURIOUS: return "curious";
    }
    return "?";
}

const char *toString(Direction direction) {
    switch (direction) {
        case Direction::CENTER:       return "C";
        case Direction::LEFT:         return "L";
        case Direction::RIGHT:        return "R";
        case Direction::TOP:          return "T";
        case Direction::BOTTOM:       return "B";
        case Direction::TOP_LEFT:     return "TL";
        case Direction::TOP_RIGHT:    return "TR";
        case Direction::BOTTOM_LEFT:  return "BL";
        case Direction::BOTTOM_RIGHT: return "BR";
    }
    return "?";
}

const char *toString(Speed speed) {
    switch (speed) {
        case Speed::SLOW:   return "slow";
        case Speed::MEDIUM: return "medium";
        case Speed::FAST:   return "fast";
    }
    return "?";
}

const char *toString(EyeSelector eyes) {
    switch (eyes) {
        case EyeSelector::BOTH:  return "both";
        case EyeSelector::LEFT:  return "left";
        case EyeSelector::RIGHT: return "right";
    }
    return "?";
}

const char *toString(BlinkPhase phase) {
    switch (phase) {
        case BlinkPhase::IDLE:    return "idle";
        case BlinkPhase::CLOSING: return "closing";
        case BlinkPhase::CLOSED:  return "closed";
        case BlinkPhase::OPENING: return "opening";
    }
    return "?";
}

const char *toString(Easing easing) {
    switch (easing) {
        case Easing::LINEAR:     return "linear";
        case Easing::SMOOTHSTEP: return "smoothstep";
        case Easing::SINE:       return "sine";
    }
    return "?";
}

const char *toString(EyeError error) {
    switch (error) {
        case EyeError::NONE:                 return "none";
        case EyeError::INVALID_COMMAND:      return "invalid_command";
        case EyeError::CONFIG_OUT_OF_BOUNDS: return "config_out_of_bounds";
        case EyeError::DEGENERATE_GEOMETRY:  return "degenerate_geometry";
    }
    return "?";
}
