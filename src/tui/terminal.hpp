#pragma once
#include "../key.hpp"
#include <optional>

namespace karltui {

// Colour pairs registered by Terminal.
enum ColorPair : short {
    kPairAccent = 1,
    kPairSelected,
    kPairSuccess,
    kPairError,
    kPairWarning,
    kPairMuted,
};

// ncurses session for the lifetime of the object.
class Terminal {
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Wait up to timeout_ms for input. nullopt on timeout.
    std::optional<Key> read_key(int timeout_ms);

    // Hand the terminal back to the shell (for an interactive child)
    // and take it again afterwards.
    void suspend();
    void resume();

    bool has_colors() const { return colors_; }

private:
    bool colors_ = false;
    bool suspended_ = false;
};

// Map an ncurses key code to a Key. Unknown codes map to KeyCode::Unknown.
Key translate_key(int ch);

} // namespace karltui
