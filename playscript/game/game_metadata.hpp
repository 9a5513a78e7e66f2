#pragma once

#include <string>
#include <vector>

namespace playscript::game {

// Descriptive metadata shipped alongside a generated script (metadata.json).
// The loop only reads `duration`; the rest is for presentation.
struct GameMetadata {
    std::string name{"New Game"};
    std::string description{"A custom mini-game"};
    std::string type{"custom"};
    int duration{60};
    std::vector<std::string> rules{"Tap to play", "Score points before time runs out"};
    std::string version{"1.0.0"};
};

// A stored custom game: metadata plus the Lua logic text.
struct GameArtifacts {
    std::string id;
    GameMetadata metadata;
    std::string logicLua;
};

} // namespace playscript::game
