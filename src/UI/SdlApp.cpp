#include "SdlApp.hpp"

#include <iostream>
#include <string>

SdlApp::SdlApp(GameController& controllerIn, const UiLayout& layoutIn, int stepDelayMsIn)
	: controller(controllerIn),
	  layout(layoutIn),
	  mapper(layoutIn),
	  renderer(),
	  window(nullptr),
	  sdlRenderer(nullptr),
	  stepDelayMs(stepDelayMsIn),
	  lastStepTicks(0),
	  hasHovered(false),
	  hovered(),
	  running(false),
	  sdlInitialized(false) {
}

SdlApp::~SdlApp() {
	shutdown();
}

void SdlApp::shutdown() {
	if (sdlRenderer) {
		SDL_DestroyRenderer(sdlRenderer);
		sdlRenderer = nullptr;
	}
	if (window) {
		SDL_DestroyWindow(window);
		window = nullptr;
	}
	if (sdlInitialized) {
		SDL_Quit();
		sdlInitialized = false;
	}
}

bool SdlApp::init() {
	if (SDL_Init(SDL_INIT_VIDEO) != 0) {
		std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
		return false;
	}
	sdlInitialized = true;
	window = SDL_CreateWindow("Colosseum", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
					 layout.windowWidth, layout.windowHeight, SDL_WINDOW_SHOWN);
	if (!window) {
		std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
		shutdown();
		return false;
	}
	sdlRenderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
	if (!sdlRenderer) {
		std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
		shutdown();
		return false;
	}
	return true;
}

void SdlApp::run() {
	if (!init()) {
		return;
	}
	running = true;
	updateTitle();
	render();
	lastStepTicks = SDL_GetTicks();
	while (running) {
		SDL_Event event;
		while (SDL_PollEvent(&event)) {
			handleEvent(event);
		}
		Uint32 now = SDL_GetTicks();
		if (!controller.isEnded() && now - lastStepTicks >= static_cast<Uint32>(stepDelayMs)) {
			controller.tick();
			lastStepTicks = SDL_GetTicks();
		}
		updateTitle();
		render();
		SDL_Delay(16);
	}
	shutdown();
}

void SdlApp::handleEvent(const SDL_Event& event) {
	if (event.type == SDL_QUIT) {
		running = false;
		return;
	}
	if (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE) {
		running = false;
		return;
	}
	if (event.type == SDL_MOUSEMOTION) {
		int row = 0;
		int col = 0;
		hasHovered = mapper.pixelToCell(event.motion.x, event.motion.y, row, col);
		if (hasHovered) {
			hovered = Position(row, col);
		}
	}
}

void SdlApp::render() {
	SDL_SetRenderDrawColor(sdlRenderer, 245, 240, 225, 255);
	SDL_RenderClear(sdlRenderer);
	renderer.render(sdlRenderer, controller.state(), layout, hasHovered ? &hovered : nullptr);
	SDL_RenderPresent(sdlRenderer);
}

void SdlApp::updateTitle() {
	const GameState& state = controller.state();
	std::string title = "Colosseum";
	if (state.status == GameState::Status::PlayerAWon) {
		title += " - Player A (" + controller.playerName(GameState::PlayerId::A) + ") wins";
	} else if (state.status == GameState::Status::PlayerBWon) {
		title += " - Player B (" + controller.playerName(GameState::PlayerId::B) + ") wins";
	} else if (state.status == GameState::Status::Tie) {
		title += " - Tie";
	} else {
		title += " - Player " + std::string(GameState::playerName(state.toMove)) + " to move";
		if (state.debug && hasHovered) {
			title += " | cell " + std::to_string(hovered.row) + "," + std::to_string(hovered.col);
		}
	}
	title += " | " + std::to_string(state.lastResult.scoreA) + " : " + std::to_string(state.lastResult.scoreB);
	SDL_SetWindowTitle(window, title.c_str());
}
