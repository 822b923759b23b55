/*
 * Actuator Capability Interface
 *
 * Everything the engine may do to the robot. Implemented by the board
 * adapter on target and by fakes in tests. Calls are assumed correct and
 * return promptly unless documented as blocking.
 */

#ifndef ACTUATOR_H
#define ACTUATOR_H

#include <stdint.h>

enum MoveDirection {
  MOVE_FORWARD = 0,
  MOVE_BACKWARD = 1,
  MOVE_LEFT = 2,
  MOVE_RIGHT = 3
};

// Line sensor bitmask
#define LINE_SENSOR_RIGHT 0x01
#define LINE_SENSOR_LEFT  0x02

class Actuator {
public:
  virtual ~Actuator() {}

  // Signed speed per side, -100..100
  virtual void setMotors(int16_t left, int16_t right) = 0;

  // Best-effort stop. false = hardware did not confirm (engine carries on).
  virtual bool stop() = 0;

  // Instantaneous turns (no duration)
  virtual void turnLeft() = 0;
  virtual void turnRight() = 0;

  // Blocks for durationSeconds, then stops
  virtual void moveTimed(MoveDirection direction, uint8_t speed, float durationSeconds) = 0;

  // 0xRRGGBB on all lights
  virtual void setLightColor(uint32_t rgb) = 0;

  // Blocking or background depending on the platform; see ToneMode
  virtual void playTone(uint16_t freqHz, uint16_t durationMs) = 0;

  virtual uint16_t readDistanceCm() = 0;
  virtual uint8_t readLineSensors() = 0;
};

#endif // ACTUATOR_H
