#include "UiLayout.hpp"

UiLayout::UiLayout(int boardSizeIn) {
	updateForWindow(800, 800, boardSizeIn);
}

void UiLayout::updateForWindow(int width, int height, int boardSizeIn) {
	windowWidth = width;
	windowHeight = height;
	padding = 40;
	boardSize = boardSizeIn;
	int minSize = (width < height) ? width : height;
	boardPixelSize = minSize - padding * 2;
	if (boardPixelSize < 100) {
		boardPixelSize = minSize;
	}
	cellSize = boardPixelSize / boardSize;
	boardPixelSize = cellSize * boardSize;
	boardX = (width - boardPixelSize) / 2;
	boardY = (height - boardPixelSize) / 2;
	playerRadius = cellSize * 3 / 10;
	wallThickness = (cellSize / 12 > 2) ? cellSize / 12 : 2;
}
