#include "BoardRenderer.hpp"

#include <vector>

#include "CoordinateMapper.hpp"
#include "Direction.hpp"
#include "Rules.hpp"

void BoardRenderer::render(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout, const Position* hovered) {
	if (state.debug) {
		drawReachable(renderer, state, layout);
	}
	drawGrid(renderer, layout);
	drawWalls(renderer, state, layout);
	drawPlayers(renderer, state, layout);
	if (state.debug && hovered) {
		drawHovered(renderer, *hovered, layout);
	}
}

void BoardRenderer::drawGrid(SDL_Renderer* renderer, const UiLayout& layout) {
	SDL_SetRenderDrawColor(renderer, 170, 170, 170, 255);
	int startX = layout.boardX;
	int startY = layout.boardY;
	int endX = layout.boardX + layout.boardPixelSize;
	int endY = layout.boardY + layout.boardPixelSize;
	for (int i = 0; i <= layout.boardSize; ++i) {
		int x = startX + i * layout.cellSize;
		int y = startY + i * layout.cellSize;
		SDL_RenderDrawLine(renderer, x, startY, x, endY);
		SDL_RenderDrawLine(renderer, startX, y, endX, y);
	}
}

void BoardRenderer::drawReachable(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	if (state.status != GameState::Status::Running) {
		return;
	}
	CoordinateMapper mapper(layout);
	std::vector<Position> cells = Rules::reachableCells(state.board, state.activePosition(), state.adversaryPosition(), state.maxStep);
	SDL_SetRenderDrawColor(renderer, 215, 235, 200, 255);
	for (const Position& cell : cells) {
		SDL_Rect rect;
		mapper.cellToPixelOrigin(cell.row, cell.col, rect.x, rect.y);
		rect.w = layout.cellSize;
		rect.h = layout.cellSize;
		SDL_RenderFillRect(renderer, &rect);
	}
}

void BoardRenderer::drawWalls(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	CoordinateMapper mapper(layout);
	int size = state.board.getSize();
	int t = layout.wallThickness;
	for (int r = 0; r < size; ++r) {
		for (int c = 0; c < size; ++c) {
			int px = 0;
			int py = 0;
			mapper.cellToPixelOrigin(r, c, px, py);
			bool last = state.hasLastMove && state.lastMove.destination == Position(r, c);
			for (int dir = 0; dir < Directions::kCount; ++dir) {
				if (!state.board.isWall(r, c, dir)) {
					continue;
				}
				if (last && dir == state.lastMove.direction) {
					SDL_SetRenderDrawColor(renderer, 220, 30, 30, 255);
				} else {
					SDL_SetRenderDrawColor(renderer, 30, 30, 30, 255);
				}
				SDL_Rect rect;
				switch (dir) {
				case Directions::Up:
					rect = SDL_Rect{px, py - t / 2, layout.cellSize, t};
					break;
				case Directions::Right:
					rect = SDL_Rect{px + layout.cellSize - t / 2, py, t, layout.cellSize};
					break;
				case Directions::Down:
					rect = SDL_Rect{px, py + layout.cellSize - t / 2, layout.cellSize, t};
					break;
				default:
					rect = SDL_Rect{px - t / 2, py, t, layout.cellSize};
					break;
				}
				SDL_RenderFillRect(renderer, &rect);
			}
		}
	}
}

void BoardRenderer::drawPlayers(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	CoordinateMapper mapper(layout);
	int px = 0;
	int py = 0;
	mapper.cellToPixelCenter(state.posA.row, state.posA.col, px, py);
	drawFilledCircle(renderer, px, py, layout.playerRadius, SDL_Color{40, 90, 200, 255});
	mapper.cellToPixelCenter(state.posB.row, state.posB.col, px, py);
	drawFilledCircle(renderer, px, py, layout.playerRadius, SDL_Color{200, 50, 50, 255});
}

void BoardRenderer::drawHovered(SDL_Renderer* renderer, const Position& cell, const UiLayout& layout) {
	CoordinateMapper mapper(layout);
	SDL_Rect rect;
	mapper.cellToPixelOrigin(cell.row, cell.col, rect.x, rect.y);
	rect.w = layout.cellSize;
	rect.h = layout.cellSize;
	SDL_SetRenderDrawColor(renderer, 240, 170, 30, 255);
	SDL_RenderDrawRect(renderer, &rect);
}

void BoardRenderer::drawFilledCircle(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	for (int dy = -radius; dy <= radius; ++dy) {
		for (int dx = -radius; dx <= radius; ++dx) {
			if (dx * dx + dy * dy <= radius * radius) {
				SDL_RenderDrawPoint(renderer, cx + dx, cy + dy);
			}
		}
	}
}
