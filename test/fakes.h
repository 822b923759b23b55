/*
 * Test Fakes
 *
 * In-memory Actuator and Transport that record every call.
 */

#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include <stdint.h>
#include <string>
#include <vector>
#include <deque>
#include "hal/actuator.h"
#include "hal/transport.h"

class FakeActuator : public Actuator {
public:
  FakeActuator()
    : left(0), right(0), stopCalls(0), stopResult(true)
    , turnLeftCalls(0), turnRightCalls(0)
    , timedCalls(0), lastDirection(MOVE_FORWARD), lastTimedSpeed(0), lastTimedSeconds(0.0f)
    , lightColor(0), lightCalls(0)
    , toneCalls(0), lastToneFreq(0), lastToneDuration(0)
    , distanceCm(42), lineMask(0) {}

  void setMotors(int16_t l, int16_t r) {
    left = l;
    right = r;
    calls.push_back("setMotors");
  }

  bool stop() {
    left = 0;
    right = 0;
    stopCalls++;
    calls.push_back("stop");
    return stopResult;
  }

  void turnLeft() {
    turnLeftCalls++;
    calls.push_back("turnLeft");
  }

  void turnRight() {
    turnRightCalls++;
    calls.push_back("turnRight");
  }

  void moveTimed(MoveDirection direction, uint8_t speed, float seconds) {
    timedCalls++;
    lastDirection = direction;
    lastTimedSpeed = speed;
    lastTimedSeconds = seconds;
    calls.push_back("moveTimed");
  }

  void setLightColor(uint32_t rgb) {
    lightColor = rgb;
    lightCalls++;
    calls.push_back("setLightColor");
  }

  void playTone(uint16_t freqHz, uint16_t durationMs) {
    toneCalls++;
    lastToneFreq = freqHz;
    lastToneDuration = durationMs;
    calls.push_back("playTone");
  }

  uint16_t readDistanceCm() { return distanceCm; }
  uint8_t readLineSensors() { return lineMask; }

  void clearCalls() { calls.clear(); }

  int16_t left;
  int16_t right;
  int stopCalls;
  bool stopResult;
  int turnLeftCalls;
  int turnRightCalls;
  int timedCalls;
  MoveDirection lastDirection;
  uint8_t lastTimedSpeed;
  float lastTimedSeconds;
  uint32_t lightColor;
  int lightCalls;
  int toneCalls;
  uint16_t lastToneFreq;
  uint16_t lastToneDuration;
  uint16_t distanceCm;
  uint8_t lineMask;
  std::vector<std::string> calls;
};

class FakeTransport : public Transport {
public:
  FakeTransport() : refuse(false) {}

  bool sendLine(const char* line) {
    if (refuse) {
      return false;
    }
    lines.push_back(line);
    return true;
  }

  int available() { return (int)rx.size(); }

  int read() {
    if (rx.empty()) {
      return -1;
    }
    int c = (uint8_t)rx.front();
    rx.pop_front();
    return c;
  }

  void feed(const std::string& bytes) {
    for (size_t i = 0; i < bytes.size(); i++) {
      rx.push_back(bytes[i]);
    }
  }

  void clear() { lines.clear(); }

  std::string last() const { return lines.empty() ? std::string() : lines.back(); }

  bool refuse;
  std::vector<std::string> lines;
  std::deque<char> rx;
};

#endif // TEST_FAKES_H
