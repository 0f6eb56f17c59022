/**
 * @file faces.cpp
 * @brief 表情名称查找。
 */

#include "screen/faces.hpp"

#include <string.h>

namespace screen::faces {

namespace {

struct NamedFace {
  const char* name;
  const FaceBitmap* bitmap;
};

constexpr NamedFace kFaces[] = {
    {"happy", &kHappy},   {"sad", &kSad},     {"surprised", &kSurprised},
    {"sleeping", &kSleeping}, {"angry", &kAngry}, {"love", &kLove},
};

}  // namespace

const FaceBitmap* find(const char* name) noexcept {
  if (name == nullptr) {
    return nullptr;
  }

  for (const NamedFace& f : kFaces) {
    if (strcmp(f.name, name) == 0) {
      return f.bitmap;
    }
  }
  return nullptr;
}

}  // namespace screen::faces
