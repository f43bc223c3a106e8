#include "CoordinateMapper.hpp"

CoordinateMapper::CoordinateMapper(const UiLayout& layoutIn) : layout(layoutIn) {
}

bool CoordinateMapper::pixelToCell(int px, int py, int& outRow, int& outCol) const {
	if (px < layout.boardX || py < layout.boardY) {
		return false;
	}
	int col = (px - layout.boardX) / layout.cellSize;
	int row = (py - layout.boardY) / layout.cellSize;
	if (row >= layout.boardSize || col >= layout.boardSize) {
		return false;
	}
	outRow = row;
	outCol = col;
	return true;
}

void CoordinateMapper::cellToPixelOrigin(int row, int col, int& outPx, int& outPy) const {
	outPx = layout.boardX + col * layout.cellSize;
	outPy = layout.boardY + row * layout.cellSize;
}

void CoordinateMapper::cellToPixelCenter(int row, int col, int& outPx, int& outPy) const {
	cellToPixelOrigin(row, col, outPx, outPy);
	outPx += layout.cellSize / 2;
	outPy += layout.cellSize / 2;
}
