#pragma once
/*
 * Renderer
 *
 * Purpose: paint a composed Frame onto an ITerminal.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; the Frame is built by compose_frame().
 */
#include "frame.hpp"
#include "iterminal.hpp"

class Renderer {
public:
  void render(ITerminal& term, const Frame& frame);
};
