/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/GamePlayState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include "managers/ProgressionManager.hpp"
#include "managers/SettingsManager.hpp"
#include "rendering/HudText.hpp"
#include "utils/MathUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace {
constexpr NightCage::Color HUD_TEXT = NightCage::Color::fromHex(0xd0d0d0);
constexpr NightCage::Color HUD_ACCENT = NightCage::Color::fromHex(0xffaa00);
constexpr NightCage::Color HUD_WARN = NightCage::Color::fromHex(0xff4040);
constexpr NightCage::Color MINIMAP_WALL = NightCage::Color::fromHex(0x555555);
constexpr NightCage::Color MINIMAP_PATH = NightCage::Color::fromHex(0x1a1a1a);
constexpr NightCage::Color MINIMAP_EXIT = NightCage::Color::fromHex(0x20c040);
constexpr NightCage::Color MINIMAP_DOOR = NightCage::Color::fromHex(0x6b4a2b);
constexpr NightCage::Color MINIMAP_PLAYER = NightCage::Color::fromHex(0xff3030);
constexpr float MINIMAP_CELL_PIXELS = 4.0f;
constexpr float MINIMAP_MARGIN = 12.0f;
constexpr float FUEL_BAR_WIDTH = 160.0f;
constexpr float FUEL_BAR_HEIGHT = 10.0f;

void setDrawColor(SDL_Renderer* renderer, const NightCage::Color& color) {
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

std::string pickupMessage(const NightCage::Item& item) {
  switch (item.type) {
    case NightCage::ItemType::Key: return "Picked up a key";
    case NightCage::ItemType::Artifact: return std::format("Found {}", item.name);
    case NightCage::ItemType::Note: return "Found a note";
    case NightCage::ItemType::LightSource: return "Picked up a spare candle";
  }
  return "Picked up something";
}
} // namespace

bool GamePlayState::enter() {
  auto& engine = GameEngine::Instance();
  const auto& settings = NightCage::SettingsManager::Instance();

  const float renderScale = std::clamp(
      settings.get<float>("graphics", "render_scale", DEFAULT_RENDER_SCALE), 0.1f, 1.0f);
  NightCage::RenderConfig config;
  config.width = std::max(160, static_cast<int>(static_cast<float>(engine.getLogicalWidth()) * renderScale));
  config.height = std::max(90, static_cast<int>(static_cast<float>(engine.getLogicalHeight()) * renderScale));
  config.rayCount = settings.get<int>("graphics", "ray_count", 0);
  config.fov = NightCage::degreesToRadians(settings.get<float>("gameplay", "fov_degrees", 60.0f));
  m_renderer.setConfig(config);
  m_frameBuffer.resize(m_renderer.getConfig().width, m_renderer.getConfig().height);

  if (!createFrameTexture(engine.getRenderer())) {
    return false;
  }

  m_maxLevel = std::max(1, settings.get<int>("gameplay", "max_level", DEFAULT_MAX_LEVEL));
  startRun();
  if (!m_level) {
    return false;
  }

  engine.setRelativeMouseMode(true);
  GAMEPLAY_INFO(std::format("Run started: {} mazes, frame buffer {}x{}", m_maxLevel,
                            m_frameBuffer.getWidth(), m_frameBuffer.getHeight()));
  return true;
}

bool GamePlayState::createFrameTexture(SDL_Renderer* renderer) {
  if (!renderer) {
    GAMEPLAY_ERROR("No renderer available for the frame texture");
    return false;
  }
  mp_frameTexture.reset(SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888,
                                          SDL_TEXTUREACCESS_STREAMING, m_frameBuffer.getWidth(),
                                          m_frameBuffer.getHeight()));
  if (!mp_frameTexture) {
    GAMEPLAY_ERROR(std::format("Failed to create frame texture: {}", SDL_GetError()));
    return false;
  }
  // Chunky pixels rather than a blurred upscale
  SDL_SetTextureScaleMode(mp_frameTexture.get(), SDL_SCALEMODE_NEAREST);
  return true;
}

void GamePlayState::startRun() {
  m_levelNumber = 1;
  m_runTime = 0.0f;
  m_runItems = 0;
  m_toast.clear();
  m_toastTimer = 0.0f;
  if (!startLevel(NightCage::Inventory{})) {
    m_level.reset();
  }
}

bool GamePlayState::startLevel(const NightCage::Inventory& carried) {
  const auto& progression = NightCage::ProgressionManager::Instance();

  NightCage::LevelConfig config;
  config.levelNumber = m_levelNumber;
  config.seed = NightCage::Level::seedForLevel(m_levelNumber, static_cast<uint32_t>(m_seedRng()));
  config.difficulty = std::min(progression.getData().level, NightCage::Level::MAX_DIFFICULTY);
  config.upgrades = progression.getUpgrades();
  config.inventory = carried;

  try {
    m_level = std::make_unique<NightCage::Level>(config);
  } catch (const std::exception& e) {
    GAMEPLAY_ERROR(std::format("Failed to build maze {}: {}", m_levelNumber, e.what()));
    return false;
  }

  showToast(std::format("Maze {} of {}", m_levelNumber, m_maxLevel));
  return true;
}

void GamePlayState::update(float deltaTime) {
  if (!m_level) {
    return;
  }

  m_level->setIntent(InputManager::Instance().pollMovementIntent());
  const NightCage::LevelOutcome outcome = m_level->update(deltaTime);
  m_runTime += deltaTime;

  for (const NightCage::Item& item : m_level->takePickups()) {
    if (item.type == NightCage::ItemType::Artifact) {
      NightCage::ProgressionManager::Instance().addArtifact(item.name);
    }
    showToast(pickupMessage(item));
  }
  m_toastTimer = std::max(0.0f, m_toastTimer - deltaTime);

  if (outcome == NightCage::LevelOutcome::Running) {
    return;
  }

  m_runItems += m_level->getItemsCollected();
  if (outcome == NightCage::LevelOutcome::Died) {
    finishRun(false, m_level->getDeathCause());
    return;
  }

  if (m_levelNumber >= m_maxLevel) {
    finishRun(true, std::nullopt);
    return;
  }

  const NightCage::Inventory carried = m_level->getInventory();
  ++m_levelNumber;
  GAMEPLAY_INFO(std::format("Advancing to maze {}", m_levelNumber));
  if (!startLevel(carried)) {
    // A maze that cannot be built ends the run as an escape from the previous one
    --m_levelNumber;
    finishRun(true, std::nullopt);
  }
}

void GamePlayState::finishRun(bool escaped, std::optional<NightCage::DeathCause> cause) {
  NightCage::RunStats stats;
  stats.escaped = escaped;
  stats.timeMs = static_cast<int64_t>(m_runTime * 1000.0f);
  stats.itemsCollected = m_runItems;

  const std::string causeName = cause ? std::string(NightCage::deathCauseName(*cause)) : std::string();
  NightCage::ProgressionManager::Instance().finishRun(stats, m_levelNumber, causeName);

  // Leaving the state destroys the level; nothing may touch it after this call
  mp_stateManager->changeState("GameOverState");
}

void GamePlayState::showToast(std::string message) {
  m_toast = std::move(message);
  m_toastTimer = TOAST_SECONDS;
}

void GamePlayState::render(SDL_Renderer* renderer) {
  if (!m_level || !mp_frameTexture) {
    return;
  }

  const std::vector<NightCage::Sprite> sprites = m_level->collectSprites();
  m_renderer.render(m_frameBuffer, m_level->getMaze().getGrid(), m_level->getView(),
                    m_level->getLight(), sprites, m_level->getDisplayEffects());

  if (!SDL_UpdateTexture(mp_frameTexture.get(), nullptr, m_frameBuffer.data(),
                         m_frameBuffer.getPitch())) {
    GAMEPLAY_ERROR(std::format("Failed to upload frame: {}", SDL_GetError()));
    return;
  }
  SDL_RenderTexture(renderer, mp_frameTexture.get(), nullptr, nullptr);

  renderHud(renderer);
  if (m_showMinimap) {
    renderMinimap(renderer);
  }
}

void GamePlayState::renderHud(SDL_Renderer* renderer) const {
  const auto& engine = GameEngine::Instance();
  const NightCage::Inventory& inventory = m_level->getInventory();
  const NightCage::Candle& candle = m_level->getCandle();

  float y = 12.0f;
  NightCage::drawHudText(renderer, 12.0f, y, std::format("Maze {}/{}", m_levelNumber, m_maxLevel),
                         HUD_ACCENT, 2.0f);
  y += 24.0f;
  NightCage::drawHudText(renderer, 12.0f, y,
                         std::format("Keys {}  Artifacts {}  Notes {}  Candles {}", inventory.keys,
                                     inventory.artifacts.size(), inventory.notes.size(),
                                     inventory.lightSources),
                         HUD_TEXT, 1.5f);
  y += 20.0f;

  const int totalSeconds = static_cast<int>(m_runTime);
  NightCage::drawHudText(renderer, 12.0f, y,
                         std::format("Time {}:{:02}", totalSeconds / 60, totalSeconds % 60), HUD_TEXT, 1.5f);
  y += 20.0f;

  // Fuel bar
  const SDL_FRect frame{12.0f, y, FUEL_BAR_WIDTH, FUEL_BAR_HEIGHT};
  setDrawColor(renderer, NightCage::Color::fromHex(0x303030));
  SDL_RenderFillRect(renderer, &frame);
  const float fuel = candle.getFuelFraction();
  const SDL_FRect fill{12.0f, y, FUEL_BAR_WIDTH * fuel, FUEL_BAR_HEIGHT};
  setDrawColor(renderer, fuel > 0.2f ? HUD_ACCENT : HUD_WARN);
  SDL_RenderFillRect(renderer, &fill);
  y += FUEL_BAR_HEIGHT + 8.0f;

  if (candle.isBurntOut()) {
    NightCage::drawHudText(renderer, 12.0f, y, "Your candle has gone out", HUD_WARN, 1.5f);
    y += 20.0f;
  }

  if (const NightCage::Door* exitDoor = m_level->getPuzzles().getExitDoor();
      exitDoor && !exitDoor->unlocked) {
    NightCage::drawHudText(renderer, 12.0f, y,
                           std::format("Exit sealed: {} keys needed", exitDoor->requiredKeys), HUD_TEXT, 1.5f);
  }

  const float width = static_cast<float>(engine.getLogicalWidth());
  const float height = static_cast<float>(engine.getLogicalHeight());
  if (m_toastTimer > 0.0f && !m_toast.empty()) {
    const float fade = std::min(1.0f, m_toastTimer);
    NightCage::drawHudTextCentered(renderer, width * 0.5f, height * 0.8f, m_toast,
                                   HUD_TEXT.scaled(fade), 2.0f);
  }

  if (m_showFps) {
    NightCage::drawHudText(renderer, 12.0f, height - 24.0f,
                           std::format("{:.0f} FPS", engine.getCurrentFPS()), HUD_TEXT, 1.5f);
  }
}

void GamePlayState::renderMinimap(SDL_Renderer* renderer) const {
  const auto& engine = GameEngine::Instance();
  const NightCage::Maze& maze = m_level->getMaze();
  const NightCage::MazeGrid& grid = maze.getGrid();

  const float mapWidth = static_cast<float>(grid.getWidth()) * MINIMAP_CELL_PIXELS;
  const float originX = static_cast<float>(engine.getLogicalWidth()) - mapWidth - MINIMAP_MARGIN;
  const float originY = MINIMAP_MARGIN;

  const float scale = MINIMAP_CELL_PIXELS / grid.getCellSize();
  const auto exitCell = maze.getExitCell();
  for (int row = 0; row < grid.getHeight(); ++row) {
    for (int col = 0; col < grid.getWidth(); ++col) {
      if (!m_level->isExplored(col, row)) {
        continue;
      }
      const bool isExit = exitCell && exitCell->x == col && exitCell->y == row;
      if (isExit) {
        setDrawColor(renderer, MINIMAP_EXIT);
      } else {
        setDrawColor(renderer, grid.isWallCell(col, row) ? MINIMAP_WALL : MINIMAP_PATH);
      }
      // Walls out in the dark breathe, paths stay put
      Vector2D shift(0.0f, 0.0f);
      if (!isExit && grid.isWallCell(col, row)) {
        shift = m_level->wallDisplayOffset(NightCage::GridPoint{col, row}) * scale;
      }
      const SDL_FRect cell{originX + static_cast<float>(col) * MINIMAP_CELL_PIXELS + shift.getX(),
                           originY + static_cast<float>(row) * MINIMAP_CELL_PIXELS + shift.getY(),
                           MINIMAP_CELL_PIXELS, MINIMAP_CELL_PIXELS};
      SDL_RenderFillRect(renderer, &cell);
    }
  }

  setDrawColor(renderer, MINIMAP_DOOR);
  for (const NightCage::Door& door : m_level->getPuzzles().getDoors()) {
    const NightCage::GridPoint cell = grid.worldToGrid(door.position.getX(), door.position.getY());
    if (door.unlocked || !m_level->isExplored(cell.x, cell.y)) {
      continue;
    }
    const SDL_FRect marker{originX + door.position.getX() * scale - 2.0f,
                           originY + door.position.getY() * scale - 2.0f, 4.0f, 4.0f};
    SDL_RenderFillRect(renderer, &marker);
  }

  const NightCage::Player& player = m_level->getPlayer();
  const float px = originX + player.getPosition().getX() * scale;
  const float py = originY + player.getPosition().getY() * scale;
  setDrawColor(renderer, MINIMAP_PLAYER);
  const SDL_FRect dot{px - 2.0f, py - 2.0f, 4.0f, 4.0f};
  SDL_RenderFillRect(renderer, &dot);
  SDL_RenderLine(renderer, px, py, px + std::cos(player.getAngle()) * 8.0f,
                 py + std::sin(player.getAngle()) * 8.0f);
}

void GamePlayState::handleInput() {
  const auto& inputMgr = InputManager::Instance();

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE) || inputMgr.wasKeyPressed(SDL_SCANCODE_P) ||
      inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_START)) {
    mp_stateManager->pushState("PauseState");
    return;
  }
  if (inputMgr.wasKeyPressed(SDL_SCANCODE_TAB) || inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_BACK)) {
    m_showMinimap = !m_showMinimap;
  }
  if (inputMgr.wasKeyPressed(SDL_SCANCODE_F)) {
    m_showFps = !m_showFps;
  }
}

void GamePlayState::pause() {
  GameEngine::Instance().setRelativeMouseMode(false);
}

void GamePlayState::resume() {
  GameEngine::Instance().setRelativeMouseMode(true);
}

bool GamePlayState::exit() {
  GameEngine::Instance().setRelativeMouseMode(false);
  m_level.reset();
  mp_frameTexture.reset();
  GAMEPLAY_INFO("Run closed");
  return true;
}

std::string GamePlayState::getName() const {
  return "GamePlayState";
}
