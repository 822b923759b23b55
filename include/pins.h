/*
 * Pin Mapping - ELEGOO UNO R3 + SmartCar-Shield-v1.1
 *
 * Only the headers the command engine drives are mapped.
 */

#ifndef PINS_H
#define PINS_H

#include <Arduino.h>

// Motor Driver (TB6612FNG)
// Motor A = right, Motor B = left. AIN2/BIN2 are tied to ground on the shield.
// Forward: xIN1=HIGH, PWM=speed. Reverse: xIN1=LOW. Stop: PWM=0, STBY=LOW.
#define PIN_MOTOR_PWMA 5
#define PIN_MOTOR_PWMB 6
#define PIN_MOTOR_AIN1 7
#define PIN_MOTOR_BIN1 8
#define PIN_MOTOR_STBY 3      // Must be HIGH for the bridge to drive

// Ultrasonic Sensor (HC-SR04), header "+5V 13 12 GND"
#define PIN_ULTRASONIC_TRIG 13
#define PIN_ULTRASONIC_ECHO 12

// Line Tracking Sensors (ITR20001), header "GND +5V A2 A1 A0"
#define PIN_LINE_L A2
#define PIN_LINE_R A0

// RGB LED (WS2812 via FastLED)
#define PIN_RGB_LED 4
#define NUM_LEDS 1

// Piezo buzzer on the free servo-Y header
#define PIN_BUZZER 11

// Motor Constants
#define MOTOR_PWM_MAX 255
#define TURN_SPEED_PERCENT 50     // turnLeft/turnRight spin speed

// Ultrasonic Constants
#define ULTRASONIC_MAX_DISTANCE_CM 200
#define ULTRASONIC_MIN_DISTANCE_CM 2
#define ULTRASONIC_TIMEOUT_US 30000  // 30ms timeout

// Line Sensor Constants (reflective surface reads low)
#define LINE_SENSOR_THRESHOLD_DEFAULT 512

#endif // PINS_H
