/*
 * SmartCar Actuator - ELEGOO UNO shield adapter
 *
 * Implements the Actuator capability set on the TB6612FNG bridge, the
 * WS2812 status pixel (FastLED), a piezo buzzer, the HC-SR04 ranger and
 * the ITR20001 line sensors.
 *
 * Speeds arrive as percent (0..100) and are scaled to 8-bit PWM here.
 */

#ifndef SMARTCAR_ACTUATOR_H
#define SMARTCAR_ACTUATOR_H

#include <Arduino.h>
#include <FastLED.h>
#include "../pins.h"
#include "actuator.h"

class SmartCarActuator : public Actuator {
public:
  SmartCarActuator();

  void init();

  // Fed during blocking moves and tones (wdt_reset on the UNO)
  void setIdleHook(void (*hook)()) { idleHook = hook; }

  // Blocking: playTone() returns once the tone is over (ToneMode)
  void setBlockingTone(bool blocking) { blockingTone = blocking; }

  void setMotors(int16_t left, int16_t right);
  bool stop();
  void turnLeft();
  void turnRight();
  void moveTimed(MoveDirection direction, uint8_t speed, float seconds);
  void setLightColor(uint32_t rgb);
  void playTone(uint16_t freqHz, uint16_t durationMs);
  uint16_t readDistanceCm();
  uint8_t readLineSensors();

private:
  CRGB leds[NUM_LEDS];
  int16_t leftPWM;
  int16_t rightPWM;
  void (*idleHook)();
  bool blockingTone;

  static int16_t percentToPWM(int16_t percent);
  void applyPWM(int16_t pwm, uint8_t pwmPin, uint8_t dirPin);
  void waitMs(uint32_t ms);
};

#endif // SMARTCAR_ACTUATOR_H
