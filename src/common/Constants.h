#pragma once

// Landmark topology (MediaPipe hand model)
static constexpr int HAND_LANDMARK_COUNT = 21;

// Gesture classifier defaults
static constexpr int GESTURE_HISTORY_FRAMES = 3;
static constexpr int PINCH_HOLD_TICKS = 4;
static constexpr int TRACKING_LOSS_TICKS = 5;
static constexpr int SCROLL_REPEAT_TICKS = 5;

// Palm-normalized distances
static constexpr float PINCH_ENTER_RATIO = 0.25f;
static constexpr float PINCH_EXIT_RATIO = 0.35f;
static constexpr float OPEN_SPREAD_RATIO = 0.15f;
static constexpr float MIN_PALM_SIZE = 0.01f;

// Landmarks may sit slightly outside the camera frame
static constexpr float COORDINATE_MARGIN = 0.25f;

// Cursor defaults
static constexpr double DEFAULT_SENSITIVITY = 1.0;
static constexpr double DEFAULT_SMOOTHING = 0.3;
static constexpr double DEFAULT_DEADZONE_PX = 3.0;
static constexpr double DEFAULT_ACCELERATION = 1.2;
static constexpr int DEFAULT_SCROLL_STEP = 120;

// Velocity above which acceleration kicks in (screen px per second)
static constexpr double ACCELERATION_THRESHOLD_PX_S = 450.0;
static constexpr double VELOCITY_SMOOTHING = 0.15;

// Control loop timing
static constexpr int TICK_INTERVAL_MS = 33;
static constexpr int FRAME_TIMEOUT_MS = 10;

// Calibration grid
static constexpr int CALIBRATION_BUCKETS = 6;
static constexpr double CALIBRATION_SENSITIVITY_MIN = 0.3;
static constexpr double CALIBRATION_SENSITIVITY_MAX = 2.0;
static constexpr double CALIBRATION_SMOOTHING_MIN = 0.1;
static constexpr double CALIBRATION_SMOOTHING_MAX = 0.8;
static constexpr int CALIBRATION_TRIAL_BUDGET = 12;

// Networking defaults
static constexpr int LANDMARK_SERVER_PORT = 5555;
static constexpr const char *LANDMARK_SERVER_IP = "127.0.0.1";
