#ifndef HEIGHT_ESTIMATOR_H
#define HEIGHT_ESTIMATOR_H

// Water height for a sensor mounted at the top of the container, looking
// down. Clamped at 0 and rounded to 0.01 cm. Callers must pass a valid,
// non-negative distance.
float estimateWaterHeight(float distanceCm, float containerHeightCm);

#endif // HEIGHT_ESTIMATOR_H
