#ifndef BOARDRENDERER_HPP
#define BOARDRENDERER_HPP

#include <SDL2/SDL.h>

#include "GameState.hpp"
#include "UiLayout.hpp"

class BoardRenderer {
public:
	void render(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout, const Position* hovered);

private:
	void drawGrid(SDL_Renderer* renderer, const UiLayout& layout);
	void drawReachable(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawWalls(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawPlayers(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawHovered(SDL_Renderer* renderer, const Position& cell, const UiLayout& layout);
	void drawFilledCircle(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color);
};

#endif
