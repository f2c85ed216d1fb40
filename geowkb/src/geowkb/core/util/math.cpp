#include "geowkb/core/util/math.hpp"

namespace geowkb {

namespace core {

// 15 significant digits, trailing zeros dropped. Lossy: values differing past the 15th digit print the same
string MathUtil::format_coord(double d) {
	return StringUtil::Format("%.15g", d);
}

string MathUtil::format_coord(double x, double y) {
	return format_coord(x) + " " + format_coord(y);
}

} // namespace core

} // namespace geowkb
