#pragma once
#include <Eigen/Dense>
#include <Eigen/Geometry>

using namespace Eigen;
