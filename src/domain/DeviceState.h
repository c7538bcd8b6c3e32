// DeviceState.h
// What the whole device is doing right now. One value, owned and mutated
// only by DeviceController.

#pragma once

enum class DeviceState {
  Viewfinder,
  Focusing,
  Capturing,
  Sending,      // request in flight, cancellable
  Viewing,      // presenter active (live or browsed result)
  Browsing,     // paging through saved images
  Screensaver,  // display off, idle
};

const char* deviceStateName(DeviceState state);
