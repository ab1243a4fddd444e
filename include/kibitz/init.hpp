#pragma once

/// @file init.hpp
/// Process-wide one-time setup.

namespace kibitz {

/// Build the attack tables. Safe to call from any thread, any number of
/// times; the first call does the work and the others wait for it.
void init();

}  // namespace kibitz
