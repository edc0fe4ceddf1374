#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Position/ScrollStep).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Mode { Normal, Follow };

// x: horizontal char offset, y: buffer line shown at the top of the pane
struct Position {
  int x = 0;
  int y = 0;
  bool operator==(const Position& o) const { return x == o.x && y == o.y; }
};

// A motion request relative to the pane extent, resolved only when applied.
struct ScrollStep {
  enum class Unit { Char, HalfPage, Page };
  Unit unit = Unit::Char;
  int count = 1;

  static ScrollStep chars(int n) { return {Unit::Char, n}; }
  static ScrollStep half_pages(int n) { return {Unit::HalfPage, n}; }
  static ScrollStep pages(int n) { return {Unit::Page, n}; }

  int to_chars(int page_size) const {
    if (count <= 0 || page_size < 0) return 0;
    long long n = count;
    switch (unit) {
      case Unit::Char: break;
      case Unit::HalfPage: n = n * page_size / 2; break;
      case Unit::Page: n = n * page_size; break;
    }
    return n > 0x3fffffff ? 0x3fffffff : static_cast<int>(n);
  }
};
