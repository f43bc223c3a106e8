#ifndef COORDINATEMAPPER_HPP
#define COORDINATEMAPPER_HPP

#include "UiLayout.hpp"

class CoordinateMapper {
public:
	explicit CoordinateMapper(const UiLayout& layout);
	bool pixelToCell(int px, int py, int& outRow, int& outCol) const;
	void cellToPixelOrigin(int row, int col, int& outPx, int& outPy) const;
	void cellToPixelCenter(int row, int col, int& outPx, int& outPy) const;

private:
	UiLayout layout;
};

#endif
