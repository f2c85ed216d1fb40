#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

struct MathUtil {
	static string format_coord(double d);
	static string format_coord(double x, double y);
};

} // namespace core

} // namespace geowkb
