#include "sim_state.h"
#include <algorithm>
#include <cmath>

uint32_t entityCountFor(float worldSize) {
    return std::max(1u, (uint32_t)((float)kBaseEntityCount * worldSize));
}

uint32_t canvasDimFor(float worldSize) {
    return std::max(1u, (uint32_t)((float)kBaseCanvasDim * std::sqrt(worldSize)));
}
