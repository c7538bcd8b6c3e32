// Pins.h
// Logical pin mapping for an ESP32-S3 camera board with an SPI TFT and a
// micro-SD slot. Adjust to your hardware. TFT pins are configured in the
// TFT_eSPI User_Setup.

#pragma once

// Camera (OV2640/OV5640 DVP). -1 means not connected.
#ifndef PIN_CAM_PWDN
#define PIN_CAM_PWDN -1
#endif
#ifndef PIN_CAM_RESET
#define PIN_CAM_RESET -1
#endif
#define PIN_CAM_XCLK 15
#define PIN_CAM_SIOD 4
#define PIN_CAM_SIOC 5
#define PIN_CAM_D7 16
#define PIN_CAM_D6 17
#define PIN_CAM_D5 18
#define PIN_CAM_D4 12
#define PIN_CAM_D3 10
#define PIN_CAM_D2 8
#define PIN_CAM_D1 9
#define PIN_CAM_D0 11
#define PIN_CAM_VSYNC 6
#define PIN_CAM_HREF 7
#define PIN_CAM_PCLK 13

// Buttons are active-LOW with the internal pull-up enabled.
#ifndef PIN_BTN_SHUTTER
#define PIN_BTN_SHUTTER 0
#endif
#define PIN_BTN_LEFT 1
#define PIN_BTN_RIGHT 2
#define PIN_BTN_UP 3
#define PIN_BTN_DOWN 14
#define PIN_BTN_SELECT 46
#define PIN_BTN_CONFIRM 45

// Fill light; typical LED driver modules are active-HIGH.
#ifndef PIN_FILL_LIGHT
#define PIN_FILL_LIGHT 48
#endif

// micro-SD on the shared SPI bus.
#ifndef PIN_SD_CS
#define PIN_SD_CS 21
#endif
