#include "input.hpp"

InputEvent InputEvent::key(int code, unsigned mods) {
  InputEvent ev;
  ev.type = Type::Key;
  ev.code = code;
  ev.modifiers = mods;
  return ev;
}

InputEvent InputEvent::pointer(PointerButton b, PointerKind k, int row, int col, unsigned mods) {
  InputEvent ev;
  ev.type = Type::Pointer;
  ev.button = b;
  ev.kind = k;
  ev.row = row;
  ev.col = col;
  ev.modifiers = mods;
  return ev;
}

Action action_for(const InputEvent& ev) {
  if (ev.type == InputEvent::Type::Key) {
    if (ev.code == 'c' && ev.modifiers == MOD_CTRL) return Action::Quit;
    return Action::None;
  }
  if (ev.kind != PointerKind::Down) return Action::None;
  if (ev.button == PointerButton::Left) {
    if (ev.modifiers == MOD_NONE) return Action::Reveal;
    if (ev.modifiers == MOD_SHIFT) return Action::ToggleFlag;
    return Action::None;
  }
  if (ev.button == PointerButton::Right && ev.modifiers == MOD_NONE) return Action::ToggleFlag;
  return Action::None;
}
