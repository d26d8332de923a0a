#include "height_estimator.h"

#include <math.h>

float estimateWaterHeight(float distanceCm, float containerHeightCm) {
  float height = containerHeightCm - distanceCm;
  if (height < 0.0f) {
    height = 0.0f;
  }
  return roundf(height * 100.0f) / 100.0f;
}
