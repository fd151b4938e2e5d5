#pragma once

#include "kviz/Graphics/Mesh.hpp"

#include <cstddef>

namespace kviz
{
    // generates UV sphere centered at (0,0,0) with radius = 1
    Mesh GenUntexturedUVSphere(size_t sectors, size_t stacks);
}
