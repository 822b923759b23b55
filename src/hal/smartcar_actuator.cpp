/*
 * SmartCar Actuator Implementation
 */

#include "hal/smartcar_actuator.h"
#include "config.h"

SmartCarActuator::SmartCarActuator()
  : leftPWM(0)
  , rightPWM(0)
  , idleHook(nullptr)
  , blockingTone(true)
{
}

void SmartCarActuator::init() {
  pinMode(PIN_MOTOR_PWMA, OUTPUT);
  pinMode(PIN_MOTOR_PWMB, OUTPUT);
  pinMode(PIN_MOTOR_AIN1, OUTPUT);
  pinMode(PIN_MOTOR_BIN1, OUTPUT);
  pinMode(PIN_MOTOR_STBY, OUTPUT);

  pinMode(PIN_ULTRASONIC_TRIG, OUTPUT);
  pinMode(PIN_ULTRASONIC_ECHO, INPUT);
  digitalWrite(PIN_ULTRASONIC_TRIG, LOW);

  pinMode(PIN_LINE_L, INPUT);
  pinMode(PIN_LINE_R, INPUT);
  pinMode(PIN_BUZZER, OUTPUT);

  FastLED.addLeds<NEOPIXEL, PIN_RGB_LED>(leds, NUM_LEDS);
  setLightColor(0x000000);

  stop();
}

int16_t SmartCarActuator::percentToPWM(int16_t percent) {
  percent = constrain(percent, -SPEED_MAX, SPEED_MAX);
  return (int16_t)(((int32_t)percent * MOTOR_PWM_MAX) / SPEED_MAX);
}

void SmartCarActuator::setMotors(int16_t left, int16_t right) {
  // STBY first, then direction and PWM per side
  digitalWrite(PIN_MOTOR_STBY, HIGH);

  leftPWM = percentToPWM(left);
  rightPWM = percentToPWM(right);

  // Motor A (PWMA/AIN1) = RIGHT, Motor B (PWMB/BIN1) = LEFT
  applyPWM(rightPWM, PIN_MOTOR_PWMA, PIN_MOTOR_AIN1);
  applyPWM(leftPWM, PIN_MOTOR_PWMB, PIN_MOTOR_BIN1);
}

bool SmartCarActuator::stop() {
  analogWrite(PIN_MOTOR_PWMA, 0);
  analogWrite(PIN_MOTOR_PWMB, 0);
  digitalWrite(PIN_MOTOR_STBY, LOW);
  leftPWM = 0;
  rightPWM = 0;

  // Read back STBY: LOW means the bridge is disabled
  return digitalRead(PIN_MOTOR_STBY) == LOW;
}

void SmartCarActuator::turnLeft() {
  setMotors(-TURN_SPEED_PERCENT, TURN_SPEED_PERCENT);
}

void SmartCarActuator::turnRight() {
  setMotors(TURN_SPEED_PERCENT, -TURN_SPEED_PERCENT);
}

void SmartCarActuator::moveTimed(MoveDirection direction, uint8_t speed, float seconds) {
  int16_t s = speed;
  switch (direction) {
    case MOVE_FORWARD:
      setMotors(s, s);
      break;
    case MOVE_BACKWARD:
      setMotors(-s, -s);
      break;
    case MOVE_LEFT:
      setMotors(-s, s);
      break;
    case MOVE_RIGHT:
      setMotors(s, -s);
      break;
  }

  if (seconds > 0) {
    waitMs((uint32_t)(seconds * 1000.0f));
  }
  stop();
}

void SmartCarActuator::setLightColor(uint32_t rgb) {
  leds[0] = CRGB((rgb >> 16) & 0xFF, (rgb >> 8) & 0xFF, rgb & 0xFF);
  FastLED.show();
}

void SmartCarActuator::playTone(uint16_t freqHz, uint16_t durationMs) {
  // tone() runs from a hardware timer and stops itself after durationMs
  tone(PIN_BUZZER, freqHz, durationMs);
  if (blockingTone) {
    waitMs(durationMs);
  }
}

uint16_t SmartCarActuator::readDistanceCm() {
  digitalWrite(PIN_ULTRASONIC_TRIG, LOW);
  delayMicroseconds(2);
  digitalWrite(PIN_ULTRASONIC_TRIG, HIGH);
  delayMicroseconds(10);
  digitalWrite(PIN_ULTRASONIC_TRIG, LOW);

  unsigned long duration = pulseIn(PIN_ULTRASONIC_ECHO, HIGH, ULTRASONIC_TIMEOUT_US);
  if (duration == 0) {
    return 0;  // Timeout, nothing in range
  }

  // 0.0343 cm/us, round trip
  uint16_t distance = (uint16_t)((duration * 343UL) / 20000UL);
  if (distance < ULTRASONIC_MIN_DISTANCE_CM || distance > ULTRASONIC_MAX_DISTANCE_CM) {
    return 0;
  }
  return distance;
}

uint8_t SmartCarActuator::readLineSensors() {
  // ITR20001: a dark line reflects less and reads high
  uint8_t mask = 0;
  if (analogRead(PIN_LINE_R) > LINE_SENSOR_THRESHOLD_DEFAULT) {
    mask |= LINE_SENSOR_RIGHT;
  }
  if (analogRead(PIN_LINE_L) > LINE_SENSOR_THRESHOLD_DEFAULT) {
    mask |= LINE_SENSOR_LEFT;
  }
  return mask;
}

void SmartCarActuator::applyPWM(int16_t pwm, uint8_t pwmPin, uint8_t dirPin) {
  if (pwm == 0) {
    analogWrite(pwmPin, 0);
    digitalWrite(dirPin, LOW);
    return;
  }

  // Direction before magnitude
  digitalWrite(dirPin, pwm > 0 ? HIGH : LOW);
  analogWrite(pwmPin, (uint8_t)abs(pwm));
}

void SmartCarActuator::waitMs(uint32_t ms) {
  // Sliced so the watchdog keeps getting fed
  unsigned long start = millis();
  while (millis() - start < ms) {
    if (idleHook) {
      idleHook();
    }
    delay(1);
  }
}
