#pragma once

#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

template <class T>
struct PointXY {
	T x;
	T y;

public:
	PointXY() = default;
	PointXY(const T &x_p, const T &y_p) : x(x_p), y(y_p) {
	}

	bool operator==(const PointXY &other) const {
		return x == other.x && y == other.y;
	}

	bool operator!=(const PointXY &other) const {
		return x != other.x || y != other.y;
	}
};

// Every WKB coordinate decoded by this library is a plain XY pair of doubles
struct VertexXY : public PointXY<double> {
	VertexXY() = default;
	VertexXY(double x, double y) : PointXY<double>(x, y) {
	}

	// Number of bytes a vertex occupies in a WKB buffer
	static constexpr idx_t WKB_SIZE = 2 * sizeof(double);
};

} // namespace core

} // namespace geowkb
