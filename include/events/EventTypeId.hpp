/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>

// Strongly typed event type enumeration for fast lookups
enum class EventTypeId : uint8_t {
  BeforeRender = 0,
  ClientStateChanged = 1,
  Custom = 2,
  COUNT = 3
};

#endif // EVENT_TYPE_ID_HPP
