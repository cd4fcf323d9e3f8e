/**
 * RoboEyes - Eye Event Protocol
 *
 * Host plugin layer -> eye service, newline-delimited JSON on stdin.
 */

#ifndef ROBOEYES_EYE_EVENT_PROTOCOL_H
#define ROBOEYES_EYE_EVENT_PROTOCOL_H

/**
 * Event Types (JSON "type" field):
 *
 * 1. mood     - Set mood (instant)
 *    {"type":"mood","mood":"default|angry|tired|happy|curious"}
 *
 * 2. look     - Move both eyes towards a direction
 *    {"type":"look","direction":"C|L|R|T|B|TL|TR|BL|BR","speed":"slow|medium|fast"}
 *
 * 3. blink    - Close and reopen eyelids
 *    {"type":"blink","speed":"slow|medium|fast","eye":"both|left|right"}
 *
 * 4. close    - Close eyelids and keep them closed
 *    {"type":"close","speed":"...","eye":"..."}
 *
 * 5. open     - Reopen eyelids closed with "close"
 *    {"type":"open","speed":"...","eye":"..."}
 *
 * 6. curious  - Toggle curious scaling
 *    {"type":"curious","enabled":true|false}
 *
 * 7. idle     - Enable/disable idle wander and auto-blink
 *    {"type":"idle","enabled":true|false}
 *
 * 8. coverage - Set eyelid coverage directly
 *    {"type":"coverage","top":0.0,"bottom":0.0}
 *
 * 9. wakeup   - Play the wake-up sequence
 *    {"type":"wakeup"}
 *
 * 10. status  - Print a status line on stdout
 *    {"type":"status"}
 */

// Event type strings
#define ROBOEYES_EVT_MOOD       "mood"
#define ROBOEYES_EVT_LOOK       "look"
#define ROBOEYES_EVT_BLINK      "blink"
#define ROBOEYES_EVT_CLOSE      "close"
#define ROBOEYES_EVT_OPEN       "open"
#define ROBOEYES_EVT_CURIOUS    "curious"
#define ROBOEYES_EVT_IDLE       "idle"
#define ROBOEYES_EVT_COVERAGE   "coverage"
#define ROBOEYES_EVT_WAKEUP     "wakeup"
#define ROBOEYES_EVT_STATUS     "status"

// Maximum event line size
#define ROBOEYES_EVENT_MAX_SIZE 512

#endif // ROBOEYES_EYE_EVENT_PROTOCOL_H
