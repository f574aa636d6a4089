/*
 * Mailbox chess rules engine with an alpha-beta opponent.
 * Umbrella header: everything a front end needs.
 */

#ifndef GAMBIT_HPP
#define GAMBIT_HPP

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "board.hpp"
#include "movegen.hpp"
#include "rules.hpp"
#include "evaluator.hpp"
#include "engine.hpp"
#include "strategy.hpp"
#include "game.hpp"

#endif // GAMBIT_HPP
