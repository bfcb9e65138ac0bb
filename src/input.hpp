#pragma once
/*
 * Input
 *
 * Purpose: backend-neutral input events and their mapping to game actions.
 * Note: backends (ncurses/headless) produce InputEvent; nothing here touches
 * the terminal.
 */

enum Modifier : unsigned {
  MOD_NONE  = 0,
  MOD_SHIFT = 1u << 0,
  MOD_CTRL  = 1u << 1,
  MOD_ALT   = 1u << 2,
};

enum class PointerButton { Left, Right, Other };
enum class PointerKind { Down, Up, Drag };

struct InputEvent {
  enum class Type { Key, Pointer } type = Type::Key;
  int code = 0;                 // key code when type == Key
  unsigned modifiers = MOD_NONE;
  PointerButton button = PointerButton::Other;
  PointerKind kind = PointerKind::Down;
  int row = 0;                  // absolute screen position
  int col = 0;

  static InputEvent key(int code, unsigned mods = MOD_NONE);
  static InputEvent pointer(PointerButton b, PointerKind k, int row, int col, unsigned mods = MOD_NONE);
};

enum class Action { None, Reveal, ToggleFlag, Quit };

Action action_for(const InputEvent& ev);
